//
// Created by igor on 19/10/2026.
//

#include <pngme/file_io.hh>
#include <pngme/exceptions.hh>

#include <fstream>

namespace pngme {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Error opening file '", path.string(), "' for reading");

        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of file '", path.string(), "'");
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        if (!data.empty()) {
            file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                        "Error reading file '", path.string(), "': expected ", data.size(),
                        " bytes, got ", file.gcount());
        }

        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Error creating file '", path.string(), "'");

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Error writing ", data.size(), " bytes to file '", path.string(), "'");
    }

}
