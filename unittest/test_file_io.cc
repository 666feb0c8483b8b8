//
// Whole-file reads and writes
//

#include <doctest/doctest.h>
#include <pngme/file_io.hh>
#include <pngme/commands.hh>
#include <pngme/exceptions.hh>
#include <filesystem>

#include "test_utils.hh"

using namespace pngme;

namespace {
    std::filesystem::path temp_path(const std::string& name) {
        return std::filesystem::temp_directory_path() / ("pngme_unittest_" + name);
    }
}

TEST_CASE("file io") {
    SUBCASE("read fixture") {
        auto data = read_file(std::filesystem::path(UNITTEST_PATH_TO_DATA_FILES) / "tiny.png");
        CHECK(data.size() == 102);
        CHECK(data == load_test_data("tiny.png"));
    }

    SUBCASE("write then read") {
        auto path = temp_path("roundtrip.png");
        auto data = encode(load_test_data("tiny.png"), "RuSt", secret_message);

        write_file(path, data);
        CHECK(read_file(path) == data);
        CHECK(decode(read_file(path), "RuSt") == secret_message);

        // Overwrite truncates the old content
        write_file(path, load_test_data("tiny.png"));
        CHECK(read_file(path).size() == 102);

        std::filesystem::remove(path);
    }

    SUBCASE("empty file") {
        auto path = temp_path("empty.png");
        write_file(path, {});
        CHECK(read_file(path).empty());
        std::filesystem::remove(path);
    }

    SUBCASE("missing file") {
        auto path = temp_path("does_not_exist.png");
        std::filesystem::remove(path);
        try {
            read_file(path);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == error_code::io_failure);
            CHECK(std::string(e.what()).find("does_not_exist.png") != std::string::npos);
        }
    }

    SUBCASE("unwritable path") {
        auto path = temp_path("no_such_dir") / "out.png";
        CHECK_THROWS_AS(write_file(path, load_test_data("tiny.png")), io_error);
    }
}
