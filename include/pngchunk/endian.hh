//
// Host endianness and 32-bit byte swapping
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    constexpr uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Host order to big-endian and back
    constexpr uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Every multi-byte PNG field (length, CRC) is 32 bits wide
    template<typename T>
    constexpr T swap_byte_order(T x) noexcept {
        static_assert(std::is_integral_v <T> && sizeof(T) == 4,
                      "swap_byte_order only supports 32-bit integral types");
        using unsigned_t = std::make_unsigned_t <T>;
        return static_cast <T>(swap32(static_cast <unsigned_t>(x)));
    }
}
