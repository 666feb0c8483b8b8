//
// Whole-file message operations
//

#include <doctest/doctest.h>
#include <pngme/commands.hh>
#include <pngme/png_file.hh>
#include <pngme/exceptions.hh>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("encode and decode") {
    SUBCASE("message round trip through an empty container") {
        auto empty = png_bytes({});
        auto encoded = encode(empty, "RuSt", secret_message);

        auto png = png_file::parse(encoded);
        REQUIRE(png.size() == 1);
        CHECK(png.chunks()[0].crc() == secret_crc);

        CHECK(decode(png.serialize(), "RuSt") == secret_message);
    }

    SUBCASE("decode of a missing type") {
        auto encoded = encode(png_bytes({}), "RuSt", secret_message);
        try {
            decode(encoded, "xxXX");
            FAIL("Should have thrown exception");
        } catch (const not_found_error& e) {
            CHECK(e.code() == error_code::not_found);
        }
    }

    SUBCASE("encode keeps existing chunks untouched") {
        auto data = load_test_data("tiny.png");
        auto encoded = encode(data, "RuSt", secret_message);

        REQUIRE(encoded.size() == data.size() + 12 + secret_message.size());
        CHECK(std::equal(data.begin(), data.end(), encoded.begin()));

        auto png = png_file::parse(encoded);
        CHECK(png.chunks().back().type() == "RuSt"_ct);
    }

    SUBCASE("decode returns the first message of a type") {
        auto data = encode(minimal_png(), "RuSt", "first");
        data = encode(data, "RuSt", "second");
        CHECK(decode(data, "RuSt") == "first");
    }

    SUBCASE("invalid chunk type") {
        auto data = minimal_png();
        try {
            encode(data, "Ru1t", "message");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::invalid_byte);
        }
        try {
            encode(data, "RuStt", "message");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::invalid_length);
        }
    }

    SUBCASE("invalid input file") {
        auto data = to_bytes("GIF89a not a png");
        try {
            encode(data, "RuSt", "message");
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::bad_signature);
        }
        CHECK_THROWS_AS(decode(data, "RuSt"), parse_error);
        CHECK_THROWS_AS(describe(data), parse_error);
    }
}

TEST_CASE("remove message") {
    SUBCASE("encode then remove restores the original") {
        auto data = load_test_data("tiny.png");
        auto encoded = encode(data, "RuSt", secret_message);
        CHECK(remove_message(encoded, "RuSt") == data);
    }

    SUBCASE("remove of a missing type") {
        auto data = load_test_data("tiny.png");
        CHECK_THROWS_AS(remove_message(data, "RuSt"), not_found_error);
    }

    SUBCASE("remove only the first duplicate") {
        auto data = png_bytes({
            good_chunk("ABcd", "one"),
            good_chunk("EFgh", "two"),
            good_chunk("ABcd", "three")
        });

        auto png = png_file::parse(remove_message(data, "ABcd"));
        REQUIRE(png.size() == 2);
        CHECK(png.chunks()[0].type() == "EFgh"_ct);
        CHECK(png.chunks()[1].data_as_string() == "three");
    }
}

TEST_CASE("describe") {
    SUBCASE("lists encoded message") {
        auto encoded = encode(load_test_data("tiny.png"), "RuSt", secret_message);
        auto text = describe(encoded);
        CHECK(text.find("5 chunks") != std::string::npos);
        CHECK(text.find("RuSt") != std::string::npos);
        CHECK(text.find(secret_message) != std::string::npos);
    }
}
