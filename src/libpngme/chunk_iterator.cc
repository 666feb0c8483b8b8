//
// Created by igor on 19/10/2026.
//

#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>
#include <pngme/signature.hh>
#include "input.hh"

namespace pngme {

    static constexpr auto IHDR = "IHDR"_ct;
    static constexpr auto IEND = "IEND"_ct;

    chunk_iterator::chunk_iterator(const void* data, std::size_t size, const parse_options& options)
        : m_ended(true)
        , m_index(0)
        , m_seen_iend(false)
        , m_options(options) {
        THROW_PARSE_IF(size < png_signature.size(), bad_signature,
                       "Data too short for a PNG signature: ", size, " bytes, need ", png_signature.size());
        THROW_PARSE_UNLESS(has_png_signature(data, size), bad_signature,
                           "Data does not start with the PNG signature");

        m_reader = std::make_unique<reader>(data, size);
        m_reader->skip(png_signature.size());

        m_ended = false;

        // Read the first chunk
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options)
        : chunk_iterator(bytes.data(), bytes.size(), options) {
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }

        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_reader->at_end()) {
            m_current.reset();
            finish_structure();
            return false;
        }

        std::uint64_t start_pos = m_reader->tell();
        auto value = chunk::read(*m_reader, m_options);

        m_current = chunk_info{std::move(value), start_pos, m_index++};
        check_structure(*m_current);
        return true;
    }

    void chunk_iterator::check_structure(const chunk_info& info) {
        const auto& type = info.value.type();

        if (info.index == 0 && type != IHDR) {
            report(info.file_offset, "missing_ihdr",
                   "First chunk '" + type.to_string() + "' at offset " + std::to_string(info.file_offset) +
                   " is not IHDR", true);
        }

        if (m_seen_iend) {
            report(info.file_offset, "after_iend",
                   "Chunk '" + type.to_string() + "' at offset " + std::to_string(info.file_offset) +
                   " follows IEND", false);
        }

        if (!type.is_reserved_bit_valid()) {
            report(info.file_offset, "reserved_bit",
                   "Chunk '" + type.to_string() + "' at offset " + std::to_string(info.file_offset) +
                   " has the reserved bit set in its type", true);
        }

        if (type == IEND) {
            m_seen_iend = true;
        }
    }

    void chunk_iterator::finish_structure() {
        std::uint64_t end_pos = m_reader->tell();

        if (m_index == 0) {
            report(end_pos, "missing_ihdr", "File contains no chunks, IHDR expected", true);
        }

        if (!m_seen_iend) {
            report(end_pos, "missing_iend", "File ends at offset " + std::to_string(end_pos) +
                   " without an IEND chunk", true);
        }
    }

    void chunk_iterator::report(std::uint64_t offset, std::string_view category, const std::string& message, bool fatal) {
        if (fatal && m_options.strict) {
            THROW_PARSE(bad_structure, message);
        }
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngme
