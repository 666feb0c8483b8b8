//
// Created by igor on 19/10/2026.
//

#include <pngme/chunk.hh>
#include <iomanip>
#include <limits>
#include <ostream>
#include <zlib.h>

#include "input.hh"

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0), m_type(type), m_data(std::move(data)), m_crc(0) {
        THROW_PARSE_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(), chunk_too_large,
                       "Chunk '", m_type, "' data of ", m_data.size(),
                       " bytes does not fit a 32-bit length field");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = compute_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(data.size())), m_type(type), m_data(std::move(data)), m_crc(crc) {
    }

    chunk chunk::from_text(chunk_type type, std::string_view text) {
        auto first = reinterpret_cast<const std::byte*>(text.data());
        return chunk(type, std::vector<std::byte>(first, first + text.size()));
    }

    std::pair<chunk, std::size_t> chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        reader in(data, size);
        auto result = read(in, options);
        return {std::move(result), static_cast<std::size_t>(in.tell())};
    }

    std::pair<chunk, std::size_t> chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    chunk chunk::read(reader& in, const parse_options& options) {
        const std::uint64_t start = in.tell();

        auto length = in.read<std::uint32_t>(byte_order::big, "chunk length");
        THROW_PARSE_IF(length > options.max_chunk_size, chunk_too_large,
                       "Chunk at offset ", start, " has size ", length,
                       " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        std::array<std::byte, 4> type_bytes;
        THROW_PARSE_IF(in.remaining() < type_bytes.size(), truncated,
                       "Unexpected end of data at offset ", in.tell(), " while reading chunk type: requested 4 bytes, only ",
                       in.remaining(), " available");
        in.read(type_bytes.data(), type_bytes.size());
        for (std::size_t i = 0; i < type_bytes.size(); i++) {
            THROW_PARSE_UNLESS(chunk_type::is_valid_byte(type_bytes[i]), invalid_byte,
                               "Chunk at offset ", start, " has invalid type byte 0x",
                               std::hex, std::setw(2), std::setfill('0'),
                               std::to_integer<unsigned>(type_bytes[i]), std::dec,
                               " at position ", i);
        }
        auto type = chunk_type::from_bytes(type_bytes);

        auto data = in.read_exact(length, "chunk data");
        auto stored_crc = in.read<std::uint32_t>(byte_order::big, "chunk crc");

        auto computed_crc = compute_crc(type, data.data(), data.size());
        THROW_PARSE_IF(stored_crc != computed_crc, crc_mismatch,
                       "CRC mismatch in chunk '", type, "' at offset ", start,
                       ": stored 0x", std::hex, std::setw(8), std::setfill('0'), stored_crc,
                       ", computed 0x", std::setw(8), computed_crc, std::dec);

        return chunk(type, std::move(data), stored_crc);
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        serialize(out);
        return out;
    }

    void chunk::serialize(std::vector<std::byte>& out) const {
        writer w(out);
        w.write<std::uint32_t>(m_length, byte_order::big);
        w.write(m_type.bytes().data(), m_type.bytes().size());
        w.write(m_data.data(), m_data.size());
        w.write<std::uint32_t>(m_crc, byte_order::big);
    }

    std::string chunk::data_as_string() const {
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::uint32_t chunk::compute_crc(const chunk_type& type, const void* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.bytes().data()),
                    static_cast<uInt>(type.bytes().size()));
        if (size > 0) {
            crc = crc32(crc, static_cast<const Bytef*>(data), static_cast<uInt>(size));
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool chunk::operator==(const chunk& o) const {
        return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << c.type() << " (" << c.length() << " bytes, crc 0x"
           << std::hex << std::setw(8) << std::setfill('0') << c.crc() << ")";
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
