/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every malformed-input condition
 * carries a typed error code so callers can inspect why parsing failed,
 * not only that it failed.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum type_code_errc
     * @brief Reasons a textual chunk type code is rejected
     */
    enum class type_code_errc {
        length,            ///< Input is not exactly 4 bytes long
        illegal_character  ///< Input contains a byte outside A-Z / a-z
    };

    /**
     * @enum chunk_errc
     * @brief Reasons a single chunk fails to decode
     */
    enum class chunk_errc {
        too_short,          ///< Fewer than 12 bytes available
        invalid_type_code,  ///< Type code fails the character/reserved-bit rule
        crc_mismatch,       ///< Stored CRC differs from the recomputed one
        truncated_payload,  ///< Fewer bytes available than the declared length
        length_overflow     ///< Declared length exceeds parse_options::max_chunk_size
    };

    /**
     * @enum png_errc
     * @brief Reasons a container operation fails
     */
    enum class png_errc {
        signature_mismatch, ///< First 8 bytes are missing or not the PNG signature
        invalid_chunk,      ///< A chunk inside the file failed to decode
        chunk_not_found     ///< remove_chunk found no chunk of the requested type
    };

    PNGCHUNK_EXPORT const char* to_string(type_code_errc code);
    PNGCHUNK_EXPORT const char* to_string(chunk_errc code);
    PNGCHUNK_EXPORT const char* to_string(png_errc code);

    inline std::ostream& operator<<(std::ostream& os, type_code_errc code) {
        return os << to_string(code);
    }

    inline std::ostream& operator<<(std::ostream& os, chunk_errc code) {
        return os << to_string(code);
    }

    inline std::ostream& operator<<(std::ostream& os, png_errc code) {
        return os << to_string(code);
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library-specific error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a stream cannot be read or written, or when the
     * in-memory input cursor is asked for more bytes than it holds.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for malformed-input errors
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class type_code_error
     * @brief A user-supplied chunk type string was rejected
     */
    class type_code_error : public parse_error {
    public:
        type_code_error(type_code_errc code, std::size_t actual_length, const std::string& msg)
            : parse_error(msg), m_code(code), m_actual_length(actual_length) {}

        [[nodiscard]] type_code_errc code() const noexcept { return m_code; }

        /// Byte length of the rejected input
        [[nodiscard]] std::size_t actual_length() const noexcept { return m_actual_length; }

    private:
        type_code_errc m_code;
        std::size_t m_actual_length;
    };

    /**
     * @class chunk_error
     * @brief A chunk record could not be decoded
     */
    class chunk_error : public parse_error {
    public:
        chunk_error(chunk_errc code, const std::string& msg)
            : parse_error(msg), m_code(code) {}

        [[nodiscard]] chunk_errc code() const noexcept { return m_code; }

    private:
        chunk_errc m_code;
    };

    /**
     * @class png_error
     * @brief A container-level operation failed
     *
     * When a chunk inside the file fails to decode, the chunk_error is
     * wrapped with code png_errc::invalid_chunk and its original code is
     * kept in chunk_cause().
     */
    class png_error : public parse_error {
    public:
        png_error(png_errc code, const std::string& msg)
            : parse_error(msg), m_code(code) {}

        png_error(const chunk_error& cause, const std::string& msg)
            : parse_error(msg), m_code(png_errc::invalid_chunk), m_cause(cause.code()) {}

        [[nodiscard]] png_errc code() const noexcept { return m_code; }

        [[nodiscard]] std::optional<chunk_errc> chunk_cause() const noexcept { return m_cause; }

    private:
        png_errc m_code;
        std::optional<chunk_errc> m_cause;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_TYPE_CODE
     * @brief Throw a type_code_error with the given code, rejected length and message
     */
    #define THROW_TYPE_CODE(code, length, ...) \
        throw ::pngchunk::type_code_error(code, length, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK
     * @brief Throw a chunk_error with the given code and formatted message
     */
    #define THROW_CHUNK(code, ...) \
        throw ::pngchunk::chunk_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_error
     */
    #define THROW_CHUNK_IF(condition, code, ...) \
        do { if (condition) THROW_CHUNK(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PNG
     * @brief Throw a png_error with the given code and formatted message
     */
    #define THROW_PNG(code, ...) \
        throw ::pngchunk::png_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PNG_IF
     * @brief Conditionally throw a png_error
     */
    #define THROW_PNG_IF(condition, code, ...) \
        do { if (condition) THROW_PNG(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
