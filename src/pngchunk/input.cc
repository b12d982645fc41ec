//
// Memory and stream byte readers
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngchunk {
    chunk_type reader_base::read_chunk_type() {
        std::array<std::uint8_t, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_IO_IF(actual != 4, "Failed to read chunk type");
        return chunk_type::from_bytes(data);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null buffer with non-zero size");
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_IO_IF(!dst, "Null buffer in memory_reader::read");

        size = std::min(size, m_size - m_position);
        if (size > 0) {
            std::memcpy(dst, m_data + m_position, size);
            m_position += size;
        }
        return size;
    }

    void memory_reader::skip(std::uint64_t size) {
        THROW_IO_IF(size > m_size - m_position, "Skip beyond end of buffer: ", size, " > ", m_size - m_position);
        m_position += static_cast<std::size_t>(size);
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(is), m_start(0), m_size(0) {
        THROW_IO_IF(!m_stream.good(), "Stream in bad state");

        auto start = m_stream.tellg();
        THROW_IO_IF(start == std::streampos(-1), "Failed to get stream position");

        m_stream.seekg(0, std::ios::end);
        auto end = m_stream.tellg();
        THROW_IO_IF(end == std::streampos(-1), "Failed to get stream end position");

        m_stream.seekg(start, std::ios::beg);
        THROW_IO_IF(m_stream.fail(), "Failed to restore stream position");

        m_start = static_cast<std::uint64_t>(start);
        m_size = static_cast<std::uint64_t>(end - start);
    }

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_IO_IF(!dst, "Null buffer in stream_reader::read");
        THROW_IO_IF(!m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        auto bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        return bytes_read;
    }

    void stream_reader::skip(std::uint64_t size) {
        THROW_IO_IF(size > remaining(), "Skip beyond end of stream: ", size, " > ", remaining());
        m_stream.seekg(static_cast<std::streamoff>(size), std::ios::cur);
        THROW_IO_IF(m_stream.fail(), "Cannot skip ", size, " bytes");
    }

    std::uint64_t stream_reader::tell() const {
        std::streampos pos = m_stream.tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos) - m_start;
    }
}
