//
// Chunk decoding, CRC and encoding
//

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <limits>
#include <ostream>

#include <zlib.h>

namespace pngchunk {

    namespace {
        // Rejects overlong forms, surrogates and code points above U+10FFFF
        bool is_well_formed_utf8(const std::byte* data, std::size_t size) {
            std::size_t i = 0;
            while (i < size) {
                auto c = std::to_integer<std::uint8_t>(data[i]);
                if (c < 0x80) {
                    i++;
                    continue;
                }

                std::size_t extra;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    extra = 1;
                } else if (c >= 0xE0 && c <= 0xEF) {
                    extra = 2;
                    if (c == 0xE0) {
                        lo = 0xA0;
                    } else if (c == 0xED) {
                        hi = 0x9F;
                    }
                } else if (c >= 0xF0 && c <= 0xF4) {
                    extra = 3;
                    if (c == 0xF0) {
                        lo = 0x90;
                    } else if (c == 0xF4) {
                        hi = 0x8F;
                    }
                } else {
                    return false;
                }

                if (size - i - 1 < extra) {
                    return false;
                }

                // Only the first continuation byte has a narrowed range
                for (std::size_t k = 1; k <= extra; k++) {
                    auto cc = std::to_integer<std::uint8_t>(data[i + k]);
                    if (cc < lo || cc > hi) {
                        return false;
                    }
                    lo = 0x80;
                    hi = 0xBF;
                }
                i += extra + 1;
            }
            return true;
        }
    }

    std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), 4);

        auto ptr = reinterpret_cast<const Bytef*>(data);
        while (size > 0) {
            auto block = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, ptr, block);
            ptr += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(crc);
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)) {
    }

    chunk chunk::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_CHUNK_IF(size < overhead, chunk_errc::too_short,
                       "At least ", overhead, " bytes needed to decode a chunk, got ", size);

        memory_reader in(data, size);
        auto length = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        THROW_CHUNK_IF(!type.is_valid(), chunk_errc::invalid_type_code, "Invalid chunk type '", type, "'");

        if (length > options.max_chunk_size) {
            if (options.strict) {
                THROW_CHUNK(chunk_errc::length_overflow,
                            "Chunk '", type, "' has length ", length,
                            " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");
            }
            if (options.on_warning) {
                options.on_warning(0, "size_limit",
                                   build_error_msg("Chunk '", type, "' length ", length,
                                                   " exceeds maximum ", options.max_chunk_size));
            }
        }

        // size >= 12, so at least the CRC field is left after the header
        std::uint64_t available = in.remaining() - 4;
        THROW_CHUNK_IF(length > available, chunk_errc::truncated_payload,
                       "Chunk '", type, "' declares ", length, " bytes of data but only ",
                       available, " bytes remain before the CRC");

        auto payload = in.read_exact(length);
        auto stored_crc = in.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(payload));
        auto computed_crc = result.crc();
        THROW_CHUNK_IF(computed_crc != stored_crc, chunk_errc::crc_mismatch,
                       "CRC of chunk '", type, "' does not match: stored ", stored_crc,
                       ", computed ", computed_crc);

        return result;
    }

    chunk chunk::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    std::uint32_t chunk::crc() const {
        return compute_crc(m_type, m_data.data(), m_data.size());
    }

    std::optional<std::string> chunk::data_as_string() const {
        if (!is_well_formed_utf8(m_data.data(), m_data.size())) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        append_to(out);
        return out;
    }

    void chunk::append_to(std::vector<std::byte>& out) const {
        write_u32_be(out, length());
        auto type_begin = reinterpret_cast<const std::byte*>(m_type.bytes().data());
        out.insert(out.end(), type_begin, type_begin + 4);
        out.insert(out.end(), m_data.begin(), m_data.end());
        write_u32_be(out, crc());
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n";
        os << "  Length: " << c.length() << "\n";
        os << "  Type: " << c.type() << "\n";
        os << "  Data: " << c.data().size() << " bytes\n";
        os << "  Crc: " << c.crc() << "\n";
        os << "}";
        return os;
    }

} // namespace pngchunk
