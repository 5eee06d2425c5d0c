#include <doctest/doctest.h>
#include "coapwire/option_value.hpp"

using namespace coapwire;

TEST_CASE("Uint values use the shortest big-endian form") {
    uint8_t buf[4] = {0xEE, 0xEE, 0xEE, 0xEE};

    OptionValue zero = OptionValue::make_uint(0);
    CHECK(zero.length() == 0);

    OptionValue v255 = OptionValue::make_uint(255);
    REQUIRE(v255.length() == 1);
    v255.encode(buf);
    CHECK(buf[0] == 0xFF);

    OptionValue v256 = OptionValue::make_uint(256);
    REQUIRE(v256.length() == 2);
    v256.encode(buf);
    CHECK(buf[0] == 0x01);
    CHECK(buf[1] == 0x00);

    CHECK(OptionValue::make_uint(0x010000).length() == 3);
    CHECK(OptionValue::make_uint(0xFFFFFFFFu).length() == 4);
}

TEST_CASE("Uint decode: empty is zero, five bytes is malformed") {
    OptionValue v(OptionFormat::Uint);
    CHECK(v.decode(nullptr, 0) == Status::Ok);
    CHECK(v.as_uint() == 0);

    const uint8_t wire[] = {0x12, 0x34};
    CHECK(v.decode(wire, 2) == Status::Ok);
    CHECK(v.as_uint() == 0x1234);

    const uint8_t wide[] = {1, 2, 3, 4, 5};
    CHECK(v.decode(wide, 5) == Status::MalformedMessage);
}

TEST_CASE("Block descriptor packs num, more and szx") {
    BlockValue b(2, true, 2);
    CHECK(b.pack() == 0x2A);
    CHECK(b.block_size() == 64);
    CHECK(b.offset() == 128);

    OptionValue v;
    REQUIRE(OptionValue::make_block(b, v) == Status::Ok);
    REQUIRE(v.length() == 1);
    uint8_t buf[3] = {0, 0, 0};
    v.encode(buf);
    CHECK(buf[0] == 0x2A);

    OptionValue back(OptionFormat::Block);
    CHECK(back.decode(buf, 1) == Status::Ok);
    CHECK(back.as_block() == b);

    // (0, false, 0) packs to zero and takes no bytes
    OptionValue first;
    REQUIRE(OptionValue::make_block(BlockValue(0, false, 0), first) == Status::Ok);
    CHECK(first.length() == 0);

    OptionValue last;
    REQUIRE(OptionValue::make_block(BlockValue(BLOCK_NUMBER_MAX, false, 6), last) == Status::Ok);
    CHECK(last.length() == 3);
}

TEST_CASE("Block values out of range are refused") {
    OptionValue v;
    CHECK(OptionValue::make_block(BlockValue(0, false, 8), v) == Status::ValueOutOfRange);
    CHECK(OptionValue::make_block(BlockValue(BLOCK_NUMBER_MAX + 1, false, 0), v) == Status::ValueOutOfRange);

    OptionValue b(OptionFormat::Block);
    const uint8_t wide[] = {1, 2, 3, 4};
    CHECK(b.decode(wide, 4) == Status::MalformedMessage);
}

TEST_CASE("Opaque values keep bytes and respect capacity") {
    OptionValue s;
    REQUIRE(OptionValue::make_string("temp", s) == Status::Ok);
    CHECK(s.format() == OptionFormat::Opaque);
    CHECK(s.length() == 4);
    CHECK(s.bytes()[0] == 't');

    uint8_t big[CW_OPTION_VALUE_MAX + 1] = {};
    OptionValue o;
    CHECK(OptionValue::make_opaque(big, sizeof(big), o) == Status::Overflow);
    CHECK(OptionValue::make_opaque(big, CW_OPTION_VALUE_MAX, o) == Status::Ok);

    OptionValue a;
    OptionValue b;
    REQUIRE(OptionValue::make_string("x", a) == Status::Ok);
    REQUIRE(OptionValue::make_string("x", b) == Status::Ok);
    CHECK(a == b);
    CHECK(a != OptionValue::make_uint(0x78));
}
