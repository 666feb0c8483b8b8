/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic libpngme usage
 *
 * This is a minimal example showing how to walk the chunks of a PNG file
 * and print information about each of them.
 */

#include <pngme/file_io.hh>
#include <pngme/parser.hh>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        auto data = pngme::read_file(argv[1]);

        pngme::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        pngme::for_each_chunk(data, [](const auto& info) {
            const auto& type = info.value.type();
            std::cout << "Chunk: " << type
                      << " (" << info.value.length() << " bytes) at offset " << info.file_offset << "\n";
            if (!type.is_critical()) {
                std::cout << "  ancillary" << (type.is_safe_to_copy() ? ", safe to copy" : "") << "\n";
            }
        }, options);

        std::cout << "\nParsing completed successfully!\n";

    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
