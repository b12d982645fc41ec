/**
 * @file png.hh
 * @brief PNG container: signature plus an ordered sequence of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief In-memory PNG file as an ordered list of chunks
     *
     * Chunk order is preserved exactly: parsing a file and serializing it
     * again without changes yields the original bytes. No rules about
     * which chunks must appear, or in which order, are enforced.
     */
    class PNGCHUNK_EXPORT png {
    public:
        /// The 8-byte PNG file signature
        static constexpr std::array<std::byte, 8> standard_header = {
            std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47},
            std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
        };

        /**
         * @brief Empty container with the standard signature
         */
        png() = default;

        /**
         * @brief Container with the standard signature and the given chunks, in order
         */
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG file
         * @param data File contents
         * @param size Number of bytes
         * @param options Options passed to every chunk decode
         * @return The container holding every chunk in file order
         * @throws png_error with png_errc::signature_mismatch if the first 8 bytes are
         *         missing or wrong, png_errc::invalid_chunk if any chunk fails to decode
         *
         * Parsing is all-or-nothing; a failure leaves nothing behind.
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static png parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Read the stream to its end and parse the contents
         * @throws io_error if the stream cannot be read
         *
         * Reading starts at the current position. The stream must be
         * seekable, since its size is measured before reading; a pipe such
         * as std::cin fails with io_error.
         */
        static png read(std::istream& stream, const parse_options& options = {});

        /**
         * @brief Write to_bytes() to a stream
         * @throws io_error if the write fails
         */
        void write(std::ostream& stream) const;

        /// Append at the end; duplicate types are allowed
        void append_chunk(chunk c);

        void append_chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief First chunk whose type string equals @p type
         * @return Pointer into the container, nullptr if there is no match
         *
         * The pointer is invalidated by append_chunk and remove_chunk.
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove the first chunk whose type string equals @p type
         * @return The removed chunk
         * @throws png_error with png_errc::chunk_not_found if there is no match
         */
        chunk remove_chunk(std::string_view type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return m_header; }

        /// Signature followed by every chunk's encoding, in order
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

    private:
        std::vector<chunk>::const_iterator find(std::string_view type) const;

        std::array<std::byte, 8> m_header = standard_header;
        std::vector<chunk> m_chunks;
    };

    /// Multi-line description of every chunk, in order
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngchunk
