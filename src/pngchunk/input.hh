//
// Byte readers used by the chunk decoder
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Base reader interface
    class PNGCHUNK_EXPORT reader_base {
        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual void skip(std::uint64_t size) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            [[nodiscard]] std::uint64_t remaining() const {
                return size() - tell();
            }

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                std::vector<std::byte> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_IO_IF(actual != size, "Unexpected EOF: requested ", size, " bytes, got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_IO_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller-owned buffer
    class PNGCHUNK_EXPORT memory_reader : public reader_base {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            ~memory_reader() override = default;

            using reader_base::read;

            std::size_t read(void* dst, std::size_t size) override;
            void skip(std::uint64_t size) override;
            std::uint64_t tell() const override { return m_position; }
            std::uint64_t size() const override { return m_size; }

            // Unread bytes, starting at the current position
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a seekable stream, from its current position to its end
    class PNGCHUNK_EXPORT stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);
            ~stream_reader() override = default;

            using reader_base::read;

            std::size_t read(void* dst, std::size_t size) override;
            void skip(std::uint64_t size) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override { return m_size; }

        private:
            std::istream& m_stream;
            std::uint64_t m_start;
            std::uint64_t m_size;
    };

    // Big-endian 32-bit store
    inline void write_u32_be(std::vector<std::byte>& out, std::uint32_t value) {
        std::uint32_t be = swap32be(value);
        std::array<std::byte, 4> buff;
        std::memcpy(buff.data(), &be, 4);
        out.insert(out.end(), buff.begin(), buff.end());
    }
}
