//
// Four-byte PNG chunk type codes
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @struct chunk_type
     * @brief Four-byte PNG chunk type code
     *
     * Bit 5 (0x20) of each byte carries a property: ancillary (byte 0),
     * private (byte 1), reserved (byte 2) and safe-to-copy (byte 3).
     * A type code read from a file is stored as is; is_valid() tells
     * whether it follows the character and reserved-bit rules.
     */
    struct chunk_type {
        static constexpr std::uint8_t property_bit = 0x20;

        std::array<std::uint8_t, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces), not a valid type
        constexpr chunk_type() = default;

        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Raw bytes, never fails
        static constexpr chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            chunk_type result;
            result.b = bytes;
            return result;
        }

        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Parse a user-supplied type code
         * @param text Exactly four ASCII letters
         * @return The type code
         * @throws type_code_error with type_code_errc::length if text is not 4 bytes long,
         *         type_code_errc::illegal_character if a byte is not A-Z / a-z
         *
         * The reserved bit is not checked here; use is_valid() for that.
         */
        PNGCHUNK_EXPORT static chunk_type parse(std::string_view text);

        // Valid bytes are the characters A-Z or a-z
        static constexpr bool is_valid_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] constexpr bool is_critical() const {
            return (b[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const {
            return (b[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (b[2] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (b[3] & property_bit) != 0;
        }

        // Only the reserved bit constrains validity; the other property bits are descriptive
        [[nodiscard]] bool is_valid() const {
            return is_reserved_bit_valid() &&
                   std::all_of(b.begin(), b.end(), [](std::uint8_t c) { return is_valid_byte(c); });
        }

        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const {
            return b;
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Convert to string_view
        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        // Iterators
        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators, byte-wise and case-sensitive
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }
        bool operator<=(const chunk_type& o) const { return b <= o.b; }
        bool operator>(const chunk_type& o) const { return b > o.b; }
        bool operator>=(const chunk_type& o) const { return b >= o.b; }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            for (std::uint8_t c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    // Escape non-printable characters
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            return os;
        }
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Well-known chunk types
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
