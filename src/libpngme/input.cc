//
// Created by igor on 19/10/2026.
//

#include <algorithm>

#include "input.hh"

namespace pngme {
    reader::reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_PARSE_IF(!data && size != 0, truncated, "Null buffer with size ", size);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;  // EOF-like behavior
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::skip(std::size_t size) {
        THROW_PARSE_IF(size > remaining(), truncated,
                       "Cannot skip ", size, " bytes at offset ", m_position,
                       " - only ", remaining(), " bytes left");
        m_position += size;
    }
}
