//
// Error messages should name the chunk and the offending values
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <string>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("Error messages") {
    SUBCASE("input too small shows the actual size") {
        auto bytes = make_record(0, "IEND", "", 0);
        try {
            (void)chunk::parse(bytes.data(), 7);
            FAIL("Should have thrown exception");
        } catch (const input_too_small_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("16") != std::string::npos);
            CHECK(msg.find("got 7") != std::string::npos);
        }
    }

    SUBCASE("crc mismatch shows both values") {
        auto bytes = make_record(42, "RuSt", secret_message, 12345);
        try {
            (void)chunk::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const crc_mismatch_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("'RuSt'") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
            CHECK(msg.find("12345") != std::string::npos);
        }
    }

    SUBCASE("invalid type escapes non printable bytes") {
        auto bytes = make_record(0, std::string_view("R\x01St", 4), "", 0);
        try {
            (void)chunk::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const chunk_type_not_valid_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("R\\x01St") != std::string::npos);
            CHECK(msg.find("offset 4") != std::string::npos);
        }
    }

    SUBCASE("wrong length names the size") {
        try {
            (void)chunk_type::from_string("Rus");
            FAIL("Should have thrown exception");
        } catch (const chunk_type_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("got 3") != std::string::npos);
        }
    }

    SUBCASE("out of bounds length shows declared and available sizes") {
        auto bytes = make_record(1000, "RuSt", secret_message, secret_message_crc);
        try {
            (void)chunk::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const length_out_of_bounds_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(e.declared() == 1000);
            CHECK(e.available() == 46);
            CHECK(msg.find("1000") != std::string::npos);
            CHECK(msg.find("46") != std::string::npos);
        }
    }

    SUBCASE("error code names") {
        CHECK(std::string(to_string(error_code::crc_mismatch)) == "crc_mismatch");
        CHECK(std::string(to_string(error_code::wrong_length)) == "wrong_length");
        CHECK(std::string(to_string(error_code::utf8_decode_failure)) == "utf8_decode_failure");
    }

    SUBCASE("one catch block for all library errors") {
        int caught = 0;
        try {
            (void)chunk::parse(make_record(0, "IEND", "", 1));
        } catch (const pngchunk_error& e) {
            caught++;
            CHECK(e.code() == error_code::crc_mismatch);
        }
        try {
            (void)chunk_type::from_string("1234");
        } catch (const pngchunk_error& e) {
            caught++;
            CHECK(e.code() == error_code::value_not_in_range);
        }
        CHECK(caught == 2);
    }
}
