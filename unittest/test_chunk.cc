#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    chunk testing_chunk() {
        return chunk::parse(testing_chunk_bytes());
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("new chunk computes length and crc") {
            chunk c(chunk_type::parse("RuSt"), make_bytes(test_message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == test_message_crc);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.encoded_size() == 54);
        }

        SUBCASE("type validity is not checked for fresh chunks") {
            chunk c(chunk_type::from_bytes({'R', 'u', 's', 't'}), make_bytes("abc"));
            CHECK_FALSE(c.type().is_valid());
            CHECK(c.length() == 3);
        }

        SUBCASE("empty payload") {
            chunk iend(chunk_types::IEND, {});
            CHECK(iend.length() == 0);
            CHECK(iend.crc() == 0xAE426082u);
            CHECK(iend.to_bytes() == encode_chunk(0, "IEND", "", 0xAE426082u));
        }

        SUBCASE("crc is stable across calls") {
            chunk c(chunk_types::tEXt, make_bytes("Comment"));
            CHECK(c.crc() == c.crc());
        }
    }

    TEST_CASE("chunk parse") {
        SUBCASE("valid chunk from bytes") {
            auto c = testing_chunk();
            CHECK(c.length() == 42);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.crc() == test_message_crc);
            REQUIRE(c.data_as_string().has_value());
            CHECK(*c.data_as_string() == test_message);
        }

        SUBCASE("vector and pointer overloads agree") {
            auto bytes = testing_chunk_bytes();
            CHECK(chunk::parse(bytes) == chunk::parse(bytes.data(), bytes.size()));
        }

        SUBCASE("round trip of a fresh chunk") {
            chunk original(chunk_type::parse("ruSt"), make_bytes("hidden"));
            auto decoded = chunk::parse(original.to_bytes());
            CHECK(decoded.type() == original.type());
            CHECK(decoded.data() == original.data());
            CHECK(decoded.crc() == original.crc());
        }

        SUBCASE("encoding is the exact wire layout") {
            chunk c(chunk_type::parse("RuSt"), make_bytes(test_message));
            CHECK(c.to_bytes() == testing_chunk_bytes());
            CHECK(c.to_bytes().size() == 12 + 42);
        }

        SUBCASE("bytes after the chunk are ignored") {
            auto bytes = testing_chunk_bytes();
            append(bytes, make_bytes("trailing garbage"));
            auto c = chunk::parse(bytes);
            CHECK(c.encoded_size() == 54);
            CHECK(c.crc() == test_message_crc);
        }

        SUBCASE("append_to extends an existing buffer") {
            std::vector<std::byte> out = make_bytes("xy");
            testing_chunk().append_to(out);
            CHECK(out.size() == 2 + 54);
            CHECK(std::vector<std::byte>(out.begin() + 2, out.end()) == testing_chunk_bytes());
        }
    }

    TEST_CASE("chunk parse errors") {
        SUBCASE("fewer than 12 bytes") {
            auto bytes = encode_chunk(0, "IEND", "", 0xAE426082u);
            bytes.pop_back();
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(bytes); });
            CHECK(e.code() == chunk_errc::too_short);

            auto e2 = expect_error<chunk_error>([] { (void)chunk::parse(nullptr, 0); });
            CHECK(e2.code() == chunk_errc::too_short);
        }

        SUBCASE("invalid crc") {
            auto bytes = encode_chunk(42, "RuSt", test_message, 2882656333u);
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(bytes); });
            CHECK(e.code() == chunk_errc::crc_mismatch);
        }

        SUBCASE("reserved bit set") {
            chunk c(chunk_type::from_bytes({'R', 'u', 's', 't'}), make_bytes(test_message));
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(c.to_bytes()); });
            CHECK(e.code() == chunk_errc::invalid_type_code);
        }

        SUBCASE("non alphabetic type") {
            chunk c(chunk_type::from_bytes({'R', 'u', '5', 't'}), make_bytes("x"));
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(c.to_bytes()); });
            CHECK(e.code() == chunk_errc::invalid_type_code);
        }

        SUBCASE("declared length longer than the buffer") {
            auto bytes = encode_chunk(43, "RuSt", test_message, test_message_crc);
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(bytes); });
            CHECK(e.code() == chunk_errc::truncated_payload);

            auto huge = encode_chunk(0xFFFFFFFFu, "RuSt", "", 0);
            parse_options lenient;
            lenient.strict = false;
            auto e2 = expect_error<chunk_error>([&] { (void)chunk::parse(huge, lenient); });
            CHECK(e2.code() == chunk_errc::truncated_payload);
        }

        SUBCASE("declared length above the limit") {
            auto huge = encode_chunk(0x80000000u, "RuSt", "", 0);
            parse_options png_limit;
            png_limit.max_chunk_size = png_max_chunk_size;
            auto e = expect_error<chunk_error>([&] { (void)chunk::parse(huge, png_limit); });
            CHECK(e.code() == chunk_errc::length_overflow);
        }

        SUBCASE("default options accept any 32-bit length") {
            for (std::uint32_t length : {0x80000000u, 0xFFFFFFFFu}) {
                auto huge = encode_chunk(length, "RuSt", "", 0);
                auto e = expect_error<chunk_error>([&] { (void)chunk::parse(huge); });
                CHECK(e.code() == chunk_errc::truncated_payload);
            }
        }

        SUBCASE("flipping any bit of the payload or crc is detected") {
            const auto original = testing_chunk_bytes();
            // payload starts after length and type, crc is the last 4 bytes
            for (std::size_t i = 8; i < original.size(); i++) {
                for (int bit = 0; bit < 8; bit++) {
                    auto tampered = original;
                    tampered[i] ^= static_cast<std::byte>(1u << bit);
                    auto e = expect_error<chunk_error>([&] { (void)chunk::parse(tampered); });
                    CHECK(e.code() == chunk_errc::crc_mismatch);
                }
            }
        }
    }

    TEST_CASE("chunk data as text") {
        SUBCASE("ascii") {
            CHECK(testing_chunk().data_as_string() == std::string(test_message));
        }

        SUBCASE("multi-byte utf-8") {
            chunk c(chunk_type::parse("ruSt"), make_bytes("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80"));
            REQUIRE(c.data_as_string().has_value());
            CHECK(c.data_as_string()->size() == c.length());
        }

        SUBCASE("empty payload is an empty string") {
            chunk c(chunk_types::IEND, {});
            CHECK(c.data_as_string() == std::string());
        }

        SUBCASE("malformed utf-8") {
            for (std::string_view bad : {"\xFF", "abc\x80", "\xC3", "\xC0\xAF", "\xE0\x80\xAF",
                                         "\xED\xA0\x80", "\xF4\x90\x80\x80", "\xF0\x9F\x98"}) {
                chunk c(chunk_type::parse("ruSt"), make_bytes(bad));
                CHECK_FALSE(c.data_as_string().has_value());
            }
        }
    }

    TEST_CASE("chunk rendering and equality") {
        SUBCASE("multi-line description") {
            std::ostringstream oss;
            oss << testing_chunk();
            auto text = oss.str();
            CHECK(text.find("Chunk {") == 0);
            CHECK(text.find("Length: 42") != std::string::npos);
            CHECK(text.find("Type: RuSt") != std::string::npos);
            CHECK(text.find("Crc: 2882656334") != std::string::npos);
            CHECK(text.back() == '}');
        }

        SUBCASE("equality compares type and data") {
            chunk a(chunk_type::parse("ruSt"), make_bytes("one"));
            chunk b(chunk_type::parse("ruSt"), make_bytes("one"));
            chunk c(chunk_type::parse("ruSt"), make_bytes("two"));
            chunk d(chunk_type::parse("ruST"), make_bytes("one"));
            CHECK(a == b);
            CHECK(a != c);
            CHECK(a != d);
        }

        SUBCASE("compute_crc matches crc()") {
            auto data = make_bytes(test_message);
            CHECK(compute_crc(chunk_type::parse("RuSt"), data.data(), data.size()) == test_message_crc);
        }
    }
}
