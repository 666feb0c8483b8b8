//
// Created by igor on 19/10/2026.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if LIBPNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline std::uint16_t swap16(std::uint16_t x) {
        return static_cast<std::uint16_t>((x << 8) | (x >> 8));
    }

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    inline std::uint64_t swap64(std::uint64_t x) {
        return ((x << 56) |
                ((x << 40) & 0x00FF000000000000ULL) |
                ((x << 24) & 0x0000FF0000000000ULL) |
                ((x << 8) & 0x000000FF00000000ULL) |
                ((x >> 8) & 0x00000000FF000000ULL) |
                ((x >> 24) & 0x0000000000FF0000ULL) |
                ((x >> 40) & 0x000000000000FF00ULL) |
                (x >> 56));
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            std::is_integral_v<T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable<T>::value;

    // Generic swap_byte_order implementation
    template<typename T>
    constexpr T swap_byte_order(T x) noexcept {
        static_assert(is_byte_swappable_v<T>,
                      "swap_byte_order only supports integral types (1,2,4,8 bytes)");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(swap16(static_cast<std::uint16_t>(x)));
        } else if constexpr (sizeof(T) == 4) {
            return static_cast<T>(swap32(static_cast<std::uint32_t>(x)));
        } else {
            return static_cast<T>(swap64(static_cast<std::uint64_t>(x)));
        }
    }
}
