//
// Created by igor on 19/10/2026.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <functional>

#include <pngme/exceptions.hh>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Validated 4-byte PNG chunk type code
     *
     * Every byte is an ASCII letter. Bit 5 of each byte carries one property:
     * ancillary (byte 0), private (byte 1), reserved (byte 2) and
     * safe-to-copy (byte 3).
     */
    class chunk_type {
    public:
        static constexpr std::uint8_t property_bit = 0x20;

        // Constructor from raw bytes, throws parse_error(invalid_byte)
        static chunk_type from_bytes(const std::array<std::byte, 4>& bytes) {
            for (std::size_t i = 0; i < bytes.size(); i++) {
                THROW_PARSE_UNLESS(is_valid_byte(bytes[i]), invalid_byte,
                                   "Invalid chunk type byte 0x", std::hex,
                                   std::to_integer<unsigned>(bytes[i]), std::dec,
                                   " at position ", i, ": expected A-Z or a-z");
            }
            return chunk_type(bytes);
        }

        // Constructor from a pointer to 4 raw bytes
        static chunk_type from_bytes(const void* data) {
            std::array<std::byte, 4> bytes;
            std::memcpy(bytes.data(), data, 4);
            return from_bytes(bytes);
        }

        // Constructor from text, throws parse_error(invalid_length | invalid_byte)
        static chunk_type from_string(std::string_view text) {
            THROW_PARSE_UNLESS(text.size() == 4, invalid_length,
                               "Chunk type '", text, "' must be exactly 4 bytes long, got ", text.size());
            return from_bytes(text.data());
        }

        static constexpr bool is_valid_byte(std::byte b) {
            auto c = std::to_integer<unsigned char>(b);
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] constexpr const std::array<std::byte, 4>& bytes() const { return m_bytes; }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Ancillary bit (byte 0) clear
        [[nodiscard]] constexpr bool is_critical() const { return !property(0); }

        // Private bit (byte 1) clear
        [[nodiscard]] constexpr bool is_public() const { return !property(1); }

        // Reserved bit (byte 2) must be clear in conforming files
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return !property(2); }

        // Safe-to-copy bit (byte 3) set
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return property(3); }

        [[nodiscard]] constexpr bool is_valid() const { return is_reserved_bit_valid(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        bool operator==(std::string_view text) const { return to_string() == text; }
        bool operator!=(std::string_view text) const { return !(*this == text); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string();
        }

        friend constexpr chunk_type operator""_ct(const char* str, std::size_t len);

    private:
        constexpr explicit chunk_type(const std::array<std::byte, 4>& bytes)
            : m_bytes(bytes) {}

        constexpr bool property(std::size_t index) const {
            return (std::to_integer<std::uint8_t>(m_bytes[index]) & property_bit) != 0;
        }

        std::array<std::byte, 4> m_bytes;
    };

    // User-defined literal for well-known chunk types ("IHDR"_ct)
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw parse_error(error_code::invalid_length, "chunk type literal must be 4 characters");
        }
        std::array<std::byte, 4> bytes{
            std::byte(str[0]), std::byte(str[1]), std::byte(str[2]), std::byte(str[3])
        };
        for (auto b : bytes) {
            if (!chunk_type::is_valid_byte(b)) {
                throw parse_error(error_code::invalid_byte, "chunk type literal must contain only letters");
            }
        }
        return chunk_type(bytes);
    }

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
