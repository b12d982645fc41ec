//
// Test warning callback and size limit handling
//

#include <doctest/doctest.h>
#include <pngchunk/png.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

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

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};

namespace {
    // Two small chunks and one of 64 bytes
    std::vector<std::byte> file_with_large_chunk() {
        auto bytes = png_signature();
        append(bytes, chunk(chunk_type::parse("smAl"), make_bytes("tiny")).to_bytes());
        append(bytes, chunk(chunk_type::parse("laRg"), std::vector<std::byte>(64, std::byte{0x55})).to_bytes());
        append(bytes, chunk(chunk_types::IEND, {}).to_bytes());
        return bytes;
    }
}

TEST_CASE("Warning callbacks - size_limit") {
    SUBCASE("strict mode rejects large chunks") {
        parse_options opts;
        opts.max_chunk_size = 32;

        auto e = expect_error<png_error>([&] { (void)png::parse(file_with_large_chunk(), opts); });
        CHECK(e.code() == png_errc::invalid_chunk);
        CHECK(*e.chunk_cause() == chunk_errc::length_overflow);
    }

    SUBCASE("lenient mode reports and keeps large chunks") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 32;

        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        auto bytes = file_with_large_chunk();
        auto p = png::parse(bytes, opts);

        CHECK(p.chunks().size() == 3);
        CHECK(p.to_bytes() == bytes);

        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.count_category("size_limit") == 1);
        // signature (8) + first chunk (12 + 4)
        CHECK(tracker.warnings[0].offset == 24);
        CHECK(tracker.warnings[0].message.find("laRg") != std::string::npos);
    }

    SUBCASE("lenient mode without a handler is silent") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 32;

        auto p = png::parse(file_with_large_chunk(), opts);
        CHECK(p.chunks().size() == 3);
    }

    SUBCASE("single chunk offsets are relative to the chunk") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 10;

        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        auto c = chunk::parse(encode_chunk(42, "RuSt", test_message, test_message_crc), opts);
        CHECK(c.length() == 42);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].offset == 0);
    }

    SUBCASE("default limit accepts ordinary chunks") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        (void)png::parse(file_with_large_chunk(), opts);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("default limit never rejects a length") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto bytes = png_signature();
        append(bytes, encode_chunk(0x80000000u, "ruSt", "", 0));
        auto e = expect_error<png_error>([&] { (void)png::parse(bytes, opts); });
        CHECK(*e.chunk_cause() == chunk_errc::truncated_payload);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("png length limit is opt-in") {
        parse_options opts;
        opts.max_chunk_size = png_max_chunk_size;

        auto bytes = png_signature();
        append(bytes, encode_chunk(0x80000000u, "ruSt", "", 0));
        auto e = expect_error<png_error>([&] { (void)png::parse(bytes, opts); });
        CHECK(*e.chunk_cause() == chunk_errc::length_overflow);
    }

    SUBCASE("lenient mode does not relax checksums") {
        parse_options opts;
        opts.strict = false;

        auto bytes = png_signature();
        append(bytes, encode_chunk(42, "RuSt", test_message, 1));
        auto e = expect_error<png_error>([&] { (void)png::parse(bytes, opts); });
        CHECK(*e.chunk_cause() == chunk_errc::crc_mismatch);
    }
}
