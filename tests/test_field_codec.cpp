#include <doctest/doctest.h>
#include "coapwire/field_codec.hpp"

using namespace coapwire;

static EncodedField enc(uint32_t v) {
    EncodedField f;
    REQUIRE(encode_field(v, f) == Status::Ok);
    return f;
}

TEST_CASE("encode_field picks nibble and extension bytes at the thresholds") {
    EncodedField f = enc(0);
    CHECK(f.nibble == 0);
    CHECK(f.ext_len == 0);

    f = enc(12);
    CHECK(f.nibble == 12);
    CHECK(f.ext_len == 0);

    f = enc(13);
    CHECK(f.nibble == 13);
    REQUIRE(f.ext_len == 1);
    CHECK(f.ext[0] == 0x00);

    f = enc(268);
    CHECK(f.nibble == 13);
    REQUIRE(f.ext_len == 1);
    CHECK(f.ext[0] == 0xFF);

    f = enc(269);
    CHECK(f.nibble == 14);
    REQUIRE(f.ext_len == 2);
    CHECK(f.ext[0] == 0x00);
    CHECK(f.ext[1] == 0x00);

    f = enc(65803);
    CHECK(f.nibble == 14);
    REQUIRE(f.ext_len == 2);
    CHECK(f.ext[0] == 0xFF);
    CHECK(f.ext[1] == 0xFF);

    EncodedField big;
    CHECK(encode_field(65804, big) == Status::ValueOutOfRange);
}

TEST_CASE("decode_field reads extensions and reports truncation") {
    uint32_t v = 0;
    size_t used = 99;

    CHECK(decode_field(7, nullptr, 0, v, used) == Status::Ok);
    CHECK(v == 7);
    CHECK(used == 0);

    const uint8_t one[] = {0x05};
    CHECK(decode_field(13, one, 1, v, used) == Status::Ok);
    CHECK(v == 18);
    CHECK(used == 1);

    const uint8_t two[] = {0x01, 0x00};
    CHECK(decode_field(14, two, 2, v, used) == Status::Ok);
    CHECK(v == 256 + 269);
    CHECK(used == 2);

    CHECK(decode_field(13, one, 0, v, used) == Status::MalformedMessage);
    CHECK(decode_field(14, two, 1, v, used) == Status::MalformedMessage);
    CHECK(decode_field(15, two, 2, v, used) == Status::MalformedMessage);
}

TEST_CASE("a delta of 300 uses the two-byte form") {
    EncodedField f = enc(300);
    CHECK(f.nibble == 14);
    CHECK(f.ext[0] == 0x00);
    CHECK(f.ext[1] == 0x1F);

    uint32_t v = 0;
    size_t used = 0;
    CHECK(decode_field(f.nibble, f.ext, f.ext_len, v, used) == Status::Ok);
    CHECK(v == 300);
}
