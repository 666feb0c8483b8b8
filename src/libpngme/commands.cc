//
// Created by igor on 19/10/2026.
//

#include <pngme/commands.hh>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <pngme/png_file.hh>

namespace pngme {

    std::vector<std::byte> encode(const std::vector<std::byte>& input,
                                  std::string_view type_text,
                                  std::string_view message,
                                  const parse_options& options) {
        auto png = png_file::parse(input, options);
        auto type = chunk_type::from_string(type_text);

        png.append_chunk(chunk::from_text(type, message));
        return png.serialize();
    }

    std::string decode(const std::vector<std::byte>& input,
                       std::string_view type_text,
                       const parse_options& options) {
        auto png = png_file::parse(input, options);

        const auto* found = png.chunk_by_type(type_text);
        if (!found) {
            THROW_NOT_FOUND("Chunk type '", type_text, "' not found");
        }
        return found->data_as_string();
    }

    std::vector<std::byte> remove_message(const std::vector<std::byte>& input,
                                          std::string_view type_text,
                                          const parse_options& options) {
        auto png = png_file::parse(input, options);
        png.remove_chunk(type_text);
        return png.serialize();
    }

    std::string describe(const std::vector<std::byte>& input, const parse_options& options) {
        return png_file::parse(input, options).to_string();
    }

} // namespace pngme
