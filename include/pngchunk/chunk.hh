/**
 * @file chunk.hh
 * @brief A single PNG chunk record
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief CRC-32 (ISO-HDLC, as used by zlib) over type code followed by payload
     * @param type Chunk type code
     * @param data Payload bytes
     * @param size Payload size
     * @return The checksum stored in the chunk trailer
     */
    PNGCHUNK_EXPORT std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @class chunk
     * @brief Type code plus payload, encoded as length / type / data / CRC
     *
     * A chunk is immutable once built. The CRC is never stored; crc()
     * recomputes it from the current contents. Chunks decoded with parse()
     * have had the stored CRC checked against the recomputed one.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a fresh chunk
         *
         * The type code is not validated; callers that accept type codes
         * from users should obtain them through chunk_type::parse.
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode a chunk from the start of a buffer
         * @param data Buffer starting with the length field
         * @param size Number of bytes available
         * @param options Size limit and warning handling
         * @return The decoded chunk; bytes past encoded_size() are ignored
         * @throws chunk_error with
         *   - chunk_errc::too_short if fewer than 12 bytes are available
         *   - chunk_errc::invalid_type_code if the type code is not valid
         *   - chunk_errc::length_overflow if strict and the length exceeds options.max_chunk_size
         *   - chunk_errc::truncated_payload if the buffer ends before payload and CRC
         *   - chunk_errc::crc_mismatch if the stored CRC differs from the computed one
         */
        static chunk parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static chunk parse(const std::vector<std::byte>& data, const parse_options& options = {});

        [[nodiscard]] std::uint32_t length() const {
            return static_cast<std::uint32_t>(m_data.size());
        }

        [[nodiscard]] const chunk_type& type() const { return m_type; }

        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        [[nodiscard]] std::uint32_t crc() const;

        /// Number of bytes to_bytes() produces
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Payload as text
         * @return The payload if it is well-formed UTF-8, nullopt otherwise
         */
        [[nodiscard]] std::optional<std::string> data_as_string() const;

        /// Length (big-endian), type, payload, CRC (big-endian)
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /// Append the to_bytes() encoding to an existing buffer
        void append_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    /// Multi-line description: length, type, data size and CRC
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
