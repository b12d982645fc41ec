/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /// Largest chunk length the PNG format permits
    inline constexpr std::uint64_t png_max_chunk_size = 0x7FFFFFFFu;

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunk data
     *
     * Controls strictness, size limits and warning handling.
     * Checksums, type codes and the file signature are always enforced;
     * options never produce a partially parsed container.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk whose declared length exceeds max_chunk_size
         * is an error. When false, a warning is reported and the chunk is
         * decoded anyway.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload length in bytes
         *
         * Default is 2^32 - 1, which every 32-bit length field satisfies,
         * so no chunk is rejected for its size. Set it to png_max_chunk_size
         * to enforce the PNG limit of 2^31 - 1.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset of the chunk that caused the warning
         * @param category Warning category (e.g., "size_limit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
