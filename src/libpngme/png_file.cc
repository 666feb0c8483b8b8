//
// Created by igor on 19/10/2026.
//

#include <pngme/png_file.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>
#include <pngme/signature.hh>

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <istream>
#include <ostream>
#include <sstream>

namespace pngme {

    namespace {
        bool is_printable_text(const std::vector<std::byte>& data) {
            if (data.empty()) {
                return false;
            }
            return std::all_of(data.begin(), data.end(), [](std::byte b) {
                auto c = std::to_integer<unsigned char>(b);
                return (c >= 32 && c <= 126) || c == '\n' || c == '\r' || c == '\t';
            });
        }
    }

    png_file::png_file(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png_file png_file::parse(const void* data, std::size_t size, const parse_options& options) {
        std::vector<chunk> chunks;

        chunk_iterator it(data, size, options);
        while (it.has_next()) {
            chunks.push_back(std::move(it.current().value));
            it.next();
        }

        return png_file(std::move(chunks));
    }

    png_file png_file::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    png_file png_file::read(std::istream& is, const parse_options& options) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::vector<char> buffer((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
        THROW_IO_IF(is.bad(), "Stream read failed");

        return parse(buffer.data(), buffer.size(), options);
    }

    void png_file::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png_file::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png_file::remove_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("Chunk type '", type, "' not found");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png_file::serialize() const {
        std::size_t total = png_signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), png_signature.begin(), png_signature.end());
        for (const auto& c : m_chunks) {
            c.serialize(out);
        }
        return out;
    }

    void png_file::write(std::ostream& os) const {
        auto bytes = serialize();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(os.good(), "Failed to write ", bytes.size(), " bytes to stream");
    }

    std::string png_file::to_string() const {
        std::ostringstream os;

        std::size_t total = png_signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        os << "PNG file: " << m_chunks.size() << (m_chunks.size() == 1 ? " chunk, " : " chunks, ")
           << total << " bytes\n";

        std::uint64_t offset = png_signature.size();
        for (std::size_t i = 0; i < m_chunks.size(); i++) {
            const auto& c = m_chunks[i];
            const auto& type = c.type();

            os << "  [" << i << "] " << type << " at " << offset << ": "
               << c.length() << " bytes, crc 0x"
               << std::hex << std::setw(8) << std::setfill('0') << c.crc() << std::dec << std::setfill(' ')
               << ", " << (type.is_critical() ? "critical" : "ancillary")
               << ' ' << (type.is_public() ? "public" : "private")
               << ' ' << (type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy");
            if (!type.is_reserved_bit_valid()) {
                os << " reserved-bit-set";
            }
            os << "\n";

            // Message chunks carry plain text
            if (is_printable_text(c.data())) {
                os << "      text: \"" << c.data_as_string() << "\"\n";
            }

            offset += c.total_size();
        }

        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const png_file& png) {
        return os << png.to_string();
    }

} // namespace pngme
