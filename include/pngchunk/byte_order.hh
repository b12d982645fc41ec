/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for chunk fields
 */

#pragma once

#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     *
     * PNG stores every multi-byte field in network (big-endian) order;
     * little-endian is kept for completeness of the reader interface.
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (PNG length and CRC fields)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    constexpr bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return !is_big_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }
}
