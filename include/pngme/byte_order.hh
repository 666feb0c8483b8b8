/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for PNG chunk fields
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <pngme/endian.hh>

namespace pngme {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG integer field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     *
     * This is used to determine if byte swapping is needed when reading
     * or writing multi-byte values.
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }
}
