/**
 * @file png_file.hh
 * @brief In-memory PNG container: signature plus ordered chunk sequence
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png_file
     * @brief PNG file as an ordered list of chunks
     *
     * Chunk order mirrors the on-disk order. Lookups and removals by type
     * act on the first chunk of that type. Serializing a parsed file
     * reproduces the input bytes exactly.
     */
    class PNGME_EXPORT png_file {
    public:
        png_file() = default;
        explicit png_file(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG file
         * @param data File bytes, starting with the signature
         * @param size Number of bytes
         * @param options Parse options
         * @throws parse_error if the signature or any chunk is invalid; no
         *         partial result is produced
         */
        static png_file parse(const void* data, std::size_t size, const parse_options& options = parse_options{});

        static png_file parse(const std::vector<std::byte>& bytes, const parse_options& options = parse_options{});

        /**
         * @brief Read the rest of a stream and parse it
         * @throws io_error if the stream cannot be read
         */
        static png_file read(std::istream& is, const parse_options& options = parse_options{});

        /**
         * @brief Add a chunk at the end of the sequence
         */
        void append_chunk(chunk c);

        /**
         * @brief Find the first chunk of a type
         * @param type Chunk type text, e.g. "RuSt"
         * @return Pointer into the chunk list, or nullptr if absent
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove the first chunk of a type
         * @param type Chunk type text
         * @return The removed chunk
         * @throws not_found_error if no chunk has that type
         */
        chunk remove_chunk(std::string_view type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /**
         * @brief Signature followed by every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Write the serialized file to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /**
         * @brief Human-readable chunk listing
         */
        [[nodiscard]] std::string to_string() const;

    private:
        std::vector<chunk> m_chunks;
    };

    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png_file& png);

} // namespace pngme
