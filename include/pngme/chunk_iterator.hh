/**
 * @file chunk_iterator.hh
 * @brief Forward-only traversal of the chunks of a PNG byte buffer
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Iterator over the chunks of an in-memory PNG file
     *
     * The constructor verifies the PNG signature and parses the first chunk.
     * Each call to next() parses the following one. Corrupted chunks throw
     * parse_error; the iterator never skips over damage.
     *
     * While walking, the iterator checks PNG structure conventions (IHDR
     * first, an IEND present, nothing after IEND, valid reserved bits) and
     * reports them through parse_options::on_warning, or throws
     * parse_error(bad_structure) in strict mode. Chunks after IEND are only
     * ever reported as warnings.
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk value;                 ///< The parsed chunk
            std::uint64_t file_offset;   ///< Offset of the chunk's length field in the file
            std::size_t index;           ///< Position in the chunk sequence (0 = first after signature)
        };

        /**
         * @brief Start iterating a PNG file held in memory
         * @param data File bytes, starting with the signature
         * @param size Number of bytes
         * @param options Parse options for size limits and structure checks
         * @throws parse_error(bad_signature) if the signature does not match
         */
        chunk_iterator(const void* data, std::size_t size, const parse_options& options = parse_options{});

        explicit chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options = parse_options{});

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         */
        const chunk_info& current() const { return *m_current; }
        chunk_info& current() { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next();

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        bool read_next_chunk();
        void check_structure(const chunk_info& info);
        void finish_structure();
        void report(std::uint64_t offset, std::string_view category, const std::string& message, bool fatal);

        std::unique_ptr<reader> m_reader;
        std::optional<chunk_info> m_current;
        bool m_ended;
        std::size_t m_index;
        bool m_seen_iend;

        parse_options m_options;
    };

} // namespace pngme
