/**
 * @file chunk.hh
 * @brief Length-prefixed, checksummed PNG chunk record
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    class reader;

    /**
     * @class chunk
     * @brief One PNG chunk: length, type, data and CRC
     *
     * On-disk layout is `length:u32be | type:4 | data:length | crc:u32be`.
     * The CRC always equals CRC-32/IEEE over the type bytes followed by the
     * data; it is computed on construction and verified on parse, never
     * accepted from outside.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Bytes taken by the length, type and crc fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk and compute its CRC
         * @param type Chunk type
         * @param data Payload bytes
         * @throws parse_error(chunk_too_large) if data does not fit a 32-bit length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk whose payload is the bytes of a text message
         */
        static chunk from_text(chunk_type type, std::string_view text);

        /**
         * @brief Parse one chunk from the start of a byte range
         * @param data Pointer to the first byte of the chunk
         * @param size Number of bytes available
         * @param options Parse options (max_chunk_size is honored)
         * @return The chunk and the number of bytes consumed (12 + length)
         * @throws parse_error with truncated, invalid_byte, chunk_too_large or crc_mismatch
         */
        static std::pair<chunk, std::size_t> parse(const void* data, std::size_t size,
                                                   const parse_options& options = parse_options{});

        static std::pair<chunk, std::size_t> parse(const std::vector<std::byte>& bytes,
                                                   const parse_options& options = parse_options{});

        /**
         * @brief Parse one chunk at the reader's position, advancing it
         *
         * Error messages report offsets relative to the reader's start.
         */
        static chunk read(reader& in, const parse_options& options);

        /**
         * @brief Serialize to the on-disk layout
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Append the on-disk layout to an existing buffer
         */
        void serialize(std::vector<std::byte>& out) const;

        /**
         * @brief Payload as text, one char per data byte
         *
         * No character set decoding or validation is applied.
         */
        [[nodiscard]] std::string data_as_string() const;

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size of the serialized chunk
        [[nodiscard]] std::size_t total_size() const { return overhead + m_data.size(); }

        /**
         * @brief CRC-32/IEEE over type bytes followed by data
         */
        static std::uint32_t compute_crc(const chunk_type& type, const void* data, std::size_t size);

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
