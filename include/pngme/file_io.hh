//
// Created by igor on 19/10/2026.
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include <pngme/export_pngme.h>

namespace pngme {
    // Whole-file binary read, throws io_error naming the path on failure
    PNGME_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    // Create or truncate a file and write all bytes, throws io_error on failure
    PNGME_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data);
}
