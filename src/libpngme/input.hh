//
// Created by igor on 19/10/2026.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngme/export_pngme.h>
#include <pngme/exceptions.hh>
#include <pngme/byte_order.hh>

namespace pngme {

    // Forward-only reader over an in-memory byte range.
    // Running out of bytes is reported as parse_error(truncated).
    class PNGME_EXPORT reader {
        public:
            reader(const void* data, std::size_t size);

            // Copies up to size bytes, returns the number copied
            std::size_t read(void* dst, std::size_t size);
            void skip(std::size_t size);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Pointer to the unread bytes
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            // Convenience methods, what names the field for error messages
            std::vector<std::byte> read_exact(std::size_t size, const char* what) {
                THROW_PARSE_IF(size > remaining(), truncated,
                               "Unexpected end of data at offset ", m_position, " while reading ", what,
                               ": requested ", size, " bytes, only ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo, const char* what) {
                std::array<std::byte, sizeof(T)> buff;
                THROW_PARSE_IF(sizeof(T) > remaining(), truncated,
                               "Unexpected end of data at offset ", m_position, " while reading ", what,
                               ": requested ", sizeof(T), " bytes, only ", remaining(), " available");
                read(buff.data(), sizeof(T));

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Append-only writer producing a byte vector
    class writer {
        public:
            explicit writer(std::vector<std::byte>& out) : m_out(out) {}

            void write(const void* src, std::size_t size) {
                auto p = static_cast<const std::byte*>(src);
                m_out.insert(m_out.end(), p, p + size);
            }

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            [[nodiscard]] std::size_t tell() const { return m_out.size(); }

        private:
            std::vector<std::byte>& m_out;
    };
}
