//
// PNG container parsing, editing and serialization
//

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <istream>
#include <ostream>

namespace pngchunk {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_PNG_IF(size < standard_header.size(), png_errc::signature_mismatch,
                     "Input of ", size, " bytes is too short for the PNG signature");
        THROW_PNG_IF(!std::equal(standard_header.begin(), standard_header.end(), data),
                     png_errc::signature_mismatch, "Input does not start with the PNG signature");

        memory_reader in(data, size);
        in.skip(standard_header.size());

        std::vector<chunk> chunks;
        while (in.remaining() > 0) {
            std::uint64_t offset = in.tell();

            // Warnings from the chunk decoder are relative to the chunk start
            parse_options chunk_options = options;
            if (options.on_warning) {
                chunk_options.on_warning = [&options, offset](std::uint64_t rel, std::string_view category,
                                                              std::string_view message) {
                    options.on_warning(offset + rel, category, message);
                };
            }

            try {
                chunks.push_back(chunk::parse(in.current(), static_cast<std::size_t>(in.remaining()), chunk_options));
            } catch (const chunk_error& e) {
                throw png_error(e, build_error_msg("Chunk #", chunks.size(), " at offset ", offset,
                                                   " is invalid: ", e.what()));
            }
            in.skip(chunks.back().encoded_size());
        }

        return png(std::move(chunks));
    }

    png png::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    png png::read(std::istream& stream, const parse_options& options) {
        stream_reader in(stream);
        auto data = in.read_exact(static_cast<std::size_t>(in.size()));
        return parse(data, options);
    }

    void png::write(std::ostream& stream) const {
        auto data = to_bytes();
        stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(!stream, "Failed to write ", data.size(), " bytes");
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    void png::append_chunk(const chunk_type& type, std::vector<std::byte> data) {
        m_chunks.emplace_back(type, std::move(data));
    }

    std::vector<chunk>::const_iterator png::find(std::string_view type) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = find(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = find(type);
        THROW_PNG_IF(it == m_chunks.end(), png_errc::chunk_not_found, "Chunk '", type, "' not found");

        auto index = static_cast<std::size_t>(it - m_chunks.cbegin());
        chunk removed = std::move(m_chunks[index]);
        m_chunks.erase(m_chunks.begin() + static_cast<std::ptrdiff_t>(index));
        return removed;
    }

    std::vector<std::byte> png::to_bytes() const {
        std::size_t total = m_header.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), m_header.begin(), m_header.end());
        for (const auto& c : m_chunks) {
            c.append_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "Png {\n";
        os << "  Chunks: " << p.chunks().size() << "\n";
        for (const auto& c : p.chunks()) {
            os << c << "\n";
        }
        os << "}";
        return os;
    }

} // namespace pngchunk
