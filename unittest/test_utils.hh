#pragma once

#include <cstdint>
#include <fstream>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "unittest_config.h"

#include <pngme/chunk.hh>
#include <pngme/signature.hh>

// Utility function to open test files from the data directory
inline std::unique_ptr<std::istream> load_test(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_DATA_FILES);
    auto path = root / name;
    return std::make_unique<std::ifstream>(path, std::ios::binary);
}

// Load test file as byte vector for tests that need raw data
inline std::vector<std::byte> load_test_data(const std::string& name) {
    auto stream = load_test(name);
    if (!stream || !stream->good()) {
        throw std::runtime_error("Cannot open test file: " + name);
    }

    // Get file size
    stream->seekg(0, std::ios::end);
    auto size = stream->tellg();
    stream->seekg(0, std::ios::beg);

    // Read file
    std::vector<std::byte> data(static_cast<std::size_t>(size));
    stream->read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

inline std::vector<std::byte> to_bytes(std::string_view text) {
    auto first = reinterpret_cast<const std::byte*>(text.data());
    return {first, first + text.size()};
}

inline void append_u32be(std::vector<std::byte>& out, std::uint32_t value) {
    out.push_back(std::byte((value >> 24) & 0xFF));
    out.push_back(std::byte((value >> 16) & 0xFF));
    out.push_back(std::byte((value >> 8) & 0xFF));
    out.push_back(std::byte(value & 0xFF));
}

// Hand-assembled chunk with an explicit crc field
inline std::vector<std::byte> raw_chunk(std::string_view type, std::string_view data, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_u32be(out, static_cast<std::uint32_t>(data.size()));
    auto t = to_bytes(type);
    out.insert(out.end(), t.begin(), t.end());
    auto d = to_bytes(data);
    out.insert(out.end(), d.begin(), d.end());
    append_u32be(out, crc);
    return out;
}

// Correctly checksummed chunk bytes
inline std::vector<std::byte> good_chunk(std::string_view type, std::string_view data) {
    return pngme::chunk::from_text(pngme::chunk_type::from_string(type), data).serialize();
}

// Signature followed by the given chunk byte sequences
inline std::vector<std::byte> png_bytes(std::initializer_list<std::vector<std::byte>> chunks) {
    std::vector<std::byte> out(pngme::png_signature.begin(), pngme::png_signature.end());
    for (const auto& c : chunks) {
        out.insert(out.end(), c.begin(), c.end());
    }
    return out;
}

// Minimal structurally valid PNG: IHDR, IDAT, IEND
inline std::vector<std::byte> minimal_png() {
    std::string ihdr("\x00\x00\x00\x01\x00\x00\x00\x01\x08\x00\x00\x00\x00", 13);
    return png_bytes({
        good_chunk("IHDR", ihdr),
        good_chunk("IDAT", std::string("\x78\x9c\x63\x00\x00\x00\x01\x00\x01", 9)),
        good_chunk("IEND", "")
    });
}

inline const std::string secret_message = "This is where your secret message will be!";

// The 42-byte RuSt chunk with its known checksum
inline constexpr std::uint32_t secret_crc = 2882656334u;
