//
// Created by igor on 19/10/2026.
//

#include <doctest/doctest.h>

#include <pngme/parser.hh>
#include "test_utils.hh"

using namespace pngme;
using namespace std::string_literals;

TEST_CASE("test simple parser") {
    SUBCASE("for_each_chunk lambda") {
        auto data = load_test_data("tiny.png");

        std::vector<std::string> chunk_ids;
        std::vector<std::uint32_t> chunk_sizes;

        for_each_chunk(data, [&](const auto& chunk) {
            chunk_ids.push_back(chunk.value.type().to_string());
            chunk_sizes.push_back(chunk.value.length());
        });

        REQUIRE(chunk_ids.size() == 4);
        CHECK(chunk_ids[0] == "IHDR");
        CHECK(chunk_ids[1] == "tEXt");
        CHECK(chunk_ids[2] == "IDAT");
        CHECK(chunk_ids[3] == "IEND");

        CHECK(chunk_sizes[0] == 13);
        CHECK(chunk_sizes[1] == 21);
        CHECK(chunk_sizes[3] == 0);
    }

    SUBCASE("process chunk data") {
        auto data = load_test_data("tiny.png");

        std::size_t total_bytes = 0;
        for_each_chunk(data, [&](const auto& chunk) {
            total_bytes += chunk.value.total_size();
        });

        CHECK(total_bytes + 8 == data.size());
    }

    SUBCASE("filter specific chunks") {
        auto data = load_test_data("tiny.png");

        std::vector<std::string> texts;
        for_each_chunk(data, [&](const auto& chunk) {
            if (chunk.value.type() == "tEXt"_ct) {
                texts.push_back(chunk.value.data_as_string());
            }
        });

        REQUIRE(texts.size() == 1);
        CHECK(texts[0] == "Comment\0pngme fixture"s);
    }

    SUBCASE("options are forwarded") {
        auto data = load_test_data("tiny.png");

        parse_options opts;
        opts.max_chunk_size = 16;

        CHECK_THROWS_AS(for_each_chunk(data, [](const auto&) {}, opts), parse_error);
    }
}
