//
// Hardening tests for the chunk record decoder
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <limits>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("Security - declared length beyond the buffer") {
    SUBCASE("length larger than the remaining bytes") {
        auto bytes = make_record(43, "RuSt", secret_message, secret_message_crc);
        CHECK_THROWS_AS(chunk::parse(bytes), length_out_of_bounds_error);
    }

    SUBCASE("payload fits but the crc does not") {
        // 16 bytes total, 8 after the type field: 5 data bytes leave only 3 for the crc
        auto bytes = make_record(5, "RuSt", "abcd", 0);
        REQUIRE(bytes.size() == 16);
        CHECK_THROWS_AS(chunk::parse(bytes), length_out_of_bounds_error);
    }

    SUBCASE("maximum u32 length does not wrap") {
        parse_options opts;
        opts.max_chunk_length = std::numeric_limits<std::uint32_t>::max();
        auto bytes = make_record(0xFFFFFFFFu, "IDAT", "tiny", 0);
        try {
            (void)chunk::parse(bytes, opts);
            FAIL("should have thrown");
        } catch (const length_out_of_bounds_error& e) {
            CHECK(e.declared() == 0xFFFFFFFFu);
            CHECK(e.available() == 8);
        }
    }

    SUBCASE("truncated copy of a valid record") {
        auto full = secret_record();
        for (std::size_t n = chunk::min_size; n < full.size(); n++) {
            CAPTURE(n);
            CHECK_THROWS_AS(chunk::parse(full.data(), n), length_out_of_bounds_error);
        }
    }

    SUBCASE("garbage never escapes the error hierarchy") {
        std::vector<std::byte> noise(64);
        for (std::size_t i = 0; i < noise.size(); i++) {
            noise[i] = static_cast<std::byte>((i * 73 + 41) & 0xFF);
        }
        for (std::size_t n = 0; n <= noise.size(); n++) {
            CAPTURE(n);
            CHECK_THROWS_AS(chunk::parse(noise.data(), n), pngchunk_error);
        }
    }
}

TEST_CASE("Security - max chunk length enforcement") {
    SUBCASE("strict mode rejects lengths above the limit") {
        parse_options opts;
        opts.strict = true;
        opts.max_chunk_length = 16;

        try {
            (void)chunk::parse(secret_record(), opts);
            FAIL("should have thrown");
        } catch (const chunk_error& e) {
            CHECK(e.code() == error_code::length_limit_exceeded);
            std::string msg = e.what();
            CHECK(msg.find("42") != std::string::npos);
            CHECK(msg.find("16") != std::string::npos);
        }
    }

    SUBCASE("default limit is the PNG ceiling") {
        parse_options opts;
        CHECK(opts.strict);
        CHECK(opts.max_chunk_length == 0x7FFFFFFFu);

        auto bytes = make_record(0x80000000u, "IDAT", "", 0);
        try {
            (void)chunk::parse(bytes);
            FAIL("should have thrown");
        } catch (const chunk_error& e) {
            CHECK(e.code() == error_code::length_limit_exceeded);
        }
    }

    SUBCASE("lenient mode warns and continues") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_length = 16;

        bool warning_called = false;
        opts.on_warning = [&warning_called](std::uint64_t offset, std::string_view category, std::string_view) {
            if (category == "size_limit") {
                CHECK(offset == 0);
                warning_called = true;
            }
        };

        auto c = chunk::parse(secret_record(), opts);
        CHECK(warning_called);
        CHECK(c.length() == 42);
    }

    SUBCASE("lenient mode does not relax integrity checks") {
        parse_options opts;
        opts.strict = false;

        auto bad_crc = make_record(42, "RuSt", secret_message, 0);
        CHECK_THROWS_AS(chunk::parse(bad_crc, opts), crc_mismatch_error);

        auto bad_length = make_record(100, "RuSt", secret_message, secret_message_crc);
        CHECK_THROWS_AS(chunk::parse(bad_length, opts), length_out_of_bounds_error);
    }
}

TEST_CASE("Warnings") {
    struct warning {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning> warnings;
    parse_options opts;
    opts.on_warning = [&warnings](std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    };

    SUBCASE("reserved bit") {
        chunk c(chunk_type::from_string("Rust"), bytes_of("payload"));
        auto parsed = chunk::parse(c.to_bytes(), opts);
        CHECK_FALSE(parsed.type().is_valid());
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "reserved_bit");
        CHECK(warnings[0].offset == 6);
        CHECK(warnings[0].message.find("'Rust'") != std::string::npos);
    }

    SUBCASE("trailing data") {
        auto bytes = secret_record();
        bytes.resize(bytes.size() + 3);
        (void)chunk::parse(bytes, opts);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "trailing_data");
        CHECK(warnings[0].offset == 54);
        CHECK(warnings[0].message.find("3 bytes") != std::string::npos);
    }

    SUBCASE("clean record produces no warnings") {
        (void)chunk::parse(secret_record(), opts);
        CHECK(warnings.empty());
    }

    SUBCASE("no handler installed") {
        parse_options quiet;
        auto bytes = chunk(chunk_type::from_string("Rust"), {}).to_bytes();
        bytes.push_back(std::byte{0});
        CHECK_NOTHROW((void)chunk::parse(bytes, quiet));
    }
}
