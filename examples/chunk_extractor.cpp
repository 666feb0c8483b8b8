/**
 * @file chunk_extractor.cpp
 * @brief Extract specific chunks from PNG files
 *
 * This example shows how to search for and extract chunks of one type,
 * saving their payloads as separate files or displaying their contents.
 */

#include <pngme/file_io.hh>
#include <pngme/parser.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <vector>
#include <string>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <map>
#include <sstream>

class ChunkExtractor {
public:
    struct ExtractedChunk {
        pngme::chunk_type type;
        std::uint64_t offset;
        std::vector<std::byte> data;
    };

    ChunkExtractor(bool save_to_file, bool show_hex)
        : save_to_file_(save_to_file), show_hex_(show_hex) {}

    void extract(const std::string& filename, const std::string& type_text) {
        auto target = pngme::chunk_type::from_string(type_text);

        std::cout << "Extracting chunks of type: '" << target << "'\n";
        std::cout << "From file: " << filename << "\n";
        std::cout << "=========================================\n\n";

        auto data = pngme::read_file(filename);
        pngme::for_each_chunk(data, [this, &target](const auto& info) {
            if (info.value.type() == target) {
                extract_chunk(info);
            }
        });

        print_summary();

        if (save_to_file_ && !extracted_chunks_.empty()) {
            save_chunks(filename);
        }
    }

    void extract_all(const std::string& filename) {
        std::cout << "Extracting all chunks from: " << filename << "\n";
        std::cout << "=========================================\n\n";

        auto data = pngme::read_file(filename);
        pngme::for_each_chunk(data, [this](const auto& info) {
            extract_chunk(info);
        });

        print_summary();

        // Group by chunk type
        std::map<std::string, std::vector<const ExtractedChunk*>> by_type;
        for (const auto& chunk : extracted_chunks_) {
            by_type[chunk.type.to_string()].push_back(&chunk);
        }

        std::cout << "\nChunks by Type:\n";
        std::cout << "---------------\n";
        for (const auto& [type, chunks] : by_type) {
            std::uint64_t total_size = 0;
            for (const auto* chunk : chunks) {
                total_size += chunk->data.size();
            }
            std::cout << "  " << type << ": " << chunks.size() << " chunk(s), "
                      << format_size(total_size) << " total\n";
        }
    }

private:
    void extract_chunk(const pngme::chunk_iterator::chunk_info& info) {
        extracted_chunks_.push_back({info.value.type(), info.file_offset, info.value.data()});
        display_chunk(extracted_chunks_.back());
    }

    void display_chunk(const ExtractedChunk& chunk) {
        std::cout << "Found: " << chunk.type << "\n";
        std::cout << "  Offset: 0x" << std::hex << chunk.offset << std::dec << "\n";
        std::cout << "  Size: " << chunk.data.size() << " bytes\n";

        if (show_hex_ && !chunk.data.empty()) {
            std::cout << "  Data (first 256 bytes):\n";
            display_hex_dump(chunk.data.data(), std::min<std::size_t>(256, chunk.data.size()));
        }

        if (is_text_chunk(chunk)) {
            std::cout << "  Content (text):\n    \"";
            for (std::size_t i = 0; i < std::min<std::size_t>(200, chunk.data.size()); ++i) {
                auto c = std::to_integer<unsigned char>(chunk.data[i]);
                if (c >= 32 && c <= 126) {
                    std::cout << static_cast<char>(c);
                } else if (c == '\n') {
                    std::cout << "\\n";
                } else if (c == 0) {
                    std::cout << "\\0";
                } else {
                    std::cout << ".";
                }
            }
            if (chunk.data.size() > 200) {
                std::cout << "...";
            }
            std::cout << "\"\n";
        }

        std::cout << "\n";
    }

    void display_hex_dump(const std::byte* data, std::size_t size) {
        const std::size_t bytes_per_line = 16;

        for (std::size_t offset = 0; offset < size; offset += bytes_per_line) {
            std::cout << "    " << std::hex << std::setw(8) << std::setfill('0') << offset << "  ";

            for (std::size_t i = 0; i < bytes_per_line; ++i) {
                if (offset + i < size) {
                    std::cout << std::hex << std::setw(2) << std::setfill('0')
                              << std::to_integer<unsigned>(data[offset + i]) << " ";
                } else {
                    std::cout << "   ";
                }

                if (i == 7) std::cout << " ";
            }

            std::cout << " |";

            for (std::size_t i = 0; i < bytes_per_line && offset + i < size; ++i) {
                auto c = std::to_integer<unsigned char>(data[offset + i]);
                std::cout << ((c >= 32 && c <= 126) ? static_cast<char>(c) : '.');
            }

            std::cout << "|\n";
        }
        std::cout << std::dec << std::setfill(' ');
    }

    bool is_text_chunk(const ExtractedChunk& chunk) {
        // Registered textual chunk types
        auto type = chunk.type.to_string();
        if (type == "tEXt" || type == "iTXt") {
            return true;
        }

        if (chunk.data.empty()) return false;

        int printable = 0;
        int non_printable = 0;
        std::size_t check_size = std::min<std::size_t>(100, chunk.data.size());

        for (std::size_t i = 0; i < check_size; ++i) {
            auto c = std::to_integer<unsigned char>(chunk.data[i]);
            if ((c >= 32 && c <= 126) || c == '\n' || c == '\r' || c == '\t') {
                printable++;
            } else {
                non_printable++;
            }
        }

        // If >80% printable, consider it text
        return printable > 0 &&
               (static_cast<double>(printable) / (printable + non_printable)) > 0.8;
    }

    void save_chunks(const std::string& source_filename) {
        auto base_name = std::filesystem::path(source_filename).stem().string();

        std::cout << "Saving extracted chunks...\n";

        int index = 0;
        for (const auto& chunk : extracted_chunks_) {
            std::ostringstream filename;
            filename << base_name << "_" << chunk.type << "_"
                     << std::setw(3) << std::setfill('0') << index << ".chunk";

            try {
                pngme::write_file(filename.str(), chunk.data);
                std::cout << "  Saved: " << filename.str() << " (" << chunk.data.size() << " bytes)\n";
            } catch (const pngme::io_error& e) {
                std::cerr << "  Failed to save: " << e.what() << "\n";
            }

            index++;
        }
    }

    void print_summary() {
        std::cout << "Summary:\n";
        std::cout << "--------\n";
        std::cout << "  Chunks extracted: " << extracted_chunks_.size() << "\n";

        if (!extracted_chunks_.empty()) {
            std::uint64_t total_size = 0;
            for (const auto& chunk : extracted_chunks_) {
                total_size += chunk.data.size();
            }
            std::cout << "  Total data size: " << format_size(total_size) << "\n";
        }
    }

    std::string format_size(std::uint64_t size) {
        if (size < 1024) {
            return std::to_string(size) + " bytes";
        } else if (size < 1024 * 1024) {
            return std::to_string(size / 1024) + " KB";
        } else {
            return std::to_string(size / (1024 * 1024)) + " MB";
        }
    }

    bool save_to_file_ = false;
    bool show_hex_ = false;
    std::vector<ExtractedChunk> extracted_chunks_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file> [chunk_type] [options]\n";
        std::cout << "\n";
        std::cout << "Extract chunks from PNG files.\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv[0] << " image.png tEXt\n";
        std::cout << "    Extract all 'tEXt' chunks\n";
        std::cout << "\n";
        std::cout << "  " << argv[0] << " image.png RuSt --hex\n";
        std::cout << "    Extract RuSt chunks and show hex dump\n";
        std::cout << "\n";
        std::cout << "  " << argv[0] << " image.png IDAT --save\n";
        std::cout << "    Extract and save IDAT payloads to files\n";
        std::cout << "\n";
        std::cout << "  " << argv[0] << " image.png\n";
        std::cout << "    Extract all chunks (summary only)\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --hex     Show hex dump of chunk data\n";
        std::cout << "  --save    Save chunk payloads to separate files\n";
        return 1;
    }

    bool save = false;
    bool hex = false;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--save") {
            save = true;
        } else if (arg == "--hex") {
            hex = true;
        }
    }

    ChunkExtractor extractor(save, hex);

    try {
        if (argc == 2) {
            extractor.extract_all(argv[1]);
        } else {
            extractor.extract(argv[1], argv[2]);
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
