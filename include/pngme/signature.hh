//
// Created by igor on 19/10/2026.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstring>

namespace pngme {
    // Fixed 8-byte prefix of every PNG file
    inline constexpr std::array<std::byte, 8> png_signature{
        std::byte(0x89), std::byte(0x50), std::byte(0x4E), std::byte(0x47),
        std::byte(0x0D), std::byte(0x0A), std::byte(0x1A), std::byte(0x0A)
    };

    inline bool has_png_signature(const void* data, std::size_t size) {
        return data != nullptr && size >= png_signature.size() &&
               std::memcmp(data, png_signature.data(), png_signature.size()) == 0;
    }
}
