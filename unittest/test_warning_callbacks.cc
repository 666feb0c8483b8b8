//
// Test warning callback functionality and strict structure mode
//

#include <doctest/doctest.h>
#include <pngme/chunk_iterator.hh>
#include <pngme/parse_options.hh>
#include <pngme/png_file.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <functional>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};

namespace {
    void drain(const std::vector<std::byte>& data, const parse_options& opts) {
        chunk_iterator it(data, opts);
        while (it.has_next()) {
            it.next();
        }
    }
}

TEST_CASE("Warning callbacks - well formed file") {
    warning_tracker tracker;
    parse_options opts;
    opts.on_warning = std::ref(tracker);

    drain(load_test_data("tiny.png"), opts);
    CHECK(tracker.warnings.empty());

    opts.strict = true;
    CHECK_NOTHROW(drain(minimal_png(), opts));
}

TEST_CASE("Warning callbacks - missing_ihdr and missing_iend") {
    auto data = png_bytes({good_chunk("RuSt", secret_message)});

    SUBCASE("lenient mode reports and accepts") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto png = png_file::parse(data, opts);
        CHECK(png.size() == 1);

        REQUIRE(tracker.count_category("missing_ihdr") == 1);
        REQUIRE(tracker.count_category("missing_iend") == 1);
        CHECK(tracker.warnings[0].category == "missing_ihdr");
        CHECK(tracker.warnings[0].offset == 8);
        CHECK(tracker.warnings[0].message.find("RuSt") != std::string::npos);
        CHECK(tracker.warnings[1].offset == data.size());
    }

    SUBCASE("strict mode rejects") {
        parse_options opts;
        opts.strict = true;
        try {
            png_file::parse(data, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::bad_structure);
        }
    }

    SUBCASE("signature only") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        CHECK(png_file::parse(png_bytes({}), opts).empty());
        CHECK(tracker.has_warning("missing_ihdr"));
        CHECK(tracker.has_warning("missing_iend"));

        opts.strict = true;
        CHECK_THROWS_AS(png_file::parse(png_bytes({}), opts), parse_error);
    }

    SUBCASE("IEND anywhere satisfies strict mode") {
        auto with_trailer = png_bytes({
            good_chunk("IHDR", std::string(13, '\0')),
            good_chunk("IEND", ""),
            good_chunk("RuSt", secret_message)
        });
        parse_options opts;
        opts.strict = true;
        CHECK(png_file::parse(with_trailer, opts).size() == 3);
    }
}

TEST_CASE("Warning callbacks - after_iend") {
    auto data = minimal_png();
    auto iend_end = data.size();
    auto extra = good_chunk("RuSt", secret_message);
    data.insert(data.end(), extra.begin(), extra.end());

    SUBCASE("reported in lenient mode") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        drain(data, opts);
        REQUIRE(tracker.count_category("after_iend") == 1);
        CHECK(tracker.warnings[0].offset == iend_end);
    }

    SUBCASE("never fatal in strict mode") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = true;
        opts.on_warning = std::ref(tracker);

        auto png = png_file::parse(data, opts);
        CHECK(png.size() == 4);
        CHECK(tracker.has_warning("after_iend"));
    }
}

TEST_CASE("Warning callbacks - reserved_bit") {
    auto data = png_bytes({
        good_chunk("IHDR", std::string(13, '\0')),
        good_chunk("Rust", "x"),
        good_chunk("IEND", "")
    });

    SUBCASE("lenient mode reports once per chunk") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        drain(data, opts);
        CHECK(tracker.count_category("reserved_bit") == 1);
        CHECK(tracker.warnings.size() == 1);
    }

    SUBCASE("strict mode rejects") {
        parse_options opts;
        opts.strict = true;
        try {
            drain(data, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::bad_structure);
            CHECK(std::string(e.what()).find("Rust") != std::string::npos);
        }
    }
}

TEST_CASE("Warning callbacks - no handler") {
    parse_options opts;
    auto data = png_bytes({good_chunk("Rust", "x")});
    CHECK_NOTHROW(drain(data, opts));
}
