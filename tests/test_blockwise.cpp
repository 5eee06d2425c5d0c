#include <doctest/doctest.h>
#include <vector>
#include "coapwire/blockwise.hpp"

using namespace coapwire;

static Message body_message(uint8_t c, size_t len) {
    Message m(MessageType::Confirmable, c, 0x0100);
    static uint8_t bytes[CW_BODY_MAX];
    for (size_t i = 0; i < len; ++i) bytes[i] = static_cast<uint8_t>(i);
    REQUIRE(m.set_payload(bytes, len) == Status::Ok);
    return m;
}

static Message request_block(uint32_t num, bool more, uint8_t szx, size_t len, uint16_t mid) {
    Message m(MessageType::Confirmable, code::PUT, mid);
    static const uint8_t bytes[CW_PAYLOAD_MAX] = {};
    REQUIRE(m.set_payload(bytes, len) == Status::Ok);
    REQUIRE(m.options().set_block1(BlockValue(num, more, szx)) == Status::Ok);
    return m;
}

static Message response_block(uint32_t num, bool more, uint8_t szx, size_t len, uint8_t etag) {
    Message m(MessageType::Acknowledgement, code::CONTENT, static_cast<uint16_t>(num + 1));
    static const uint8_t bytes[CW_PAYLOAD_MAX] = {};
    REQUIRE(m.set_payload(bytes, len) == Status::Ok);
    REQUIRE(m.options().set_block2(BlockValue(num, more, szx)) == Status::Ok);
    OpaqueBytes tag;
    tag.push_back(etag);
    REQUIRE(m.options().set_etag(tag) == Status::Ok);
    return m;
}

// Block size is 2^(szx+4) everywhere, so 16-byte blocks are szx 0 (see DESIGN.md, block sizes).
TEST_CASE("extract_block slices a 100-byte response into 16-byte blocks") {
    Message big = body_message(code::CONTENT, 100);
    Message block;

    for (uint32_t n = 0; n <= 5; ++n) {
        REQUIRE(extract_block(big, n, 0, block) == Status::Ok);
        CHECK(block.payload().size() == 16);
        CHECK(block.payload()[0] == static_cast<uint8_t>(n * 16));
        REQUIRE(block.options().block2().has_value());
        CHECK(block.options().block2().value() == BlockValue(n, true, 0));
        CHECK_FALSE(block.message_id().has_value());
        CHECK_FALSE(block.options().has(option::BLOCK1));
    }

    REQUIRE(extract_block(big, 6, 0, block) == Status::Ok);
    CHECK(block.payload().size() == 4);
    CHECK(block.options().block2().value() == BlockValue(6, false, 0));

    CHECK(extract_block(big, 7, 0, block) == Status::NoBlock);
}

TEST_CASE("extract_block uses 2^(szx+4) bytes and Block1 on requests") {
    Message big = body_message(code::POST, 100);
    Message block;

    REQUIRE(extract_block(big, 0, 2, block) == Status::Ok);
    CHECK(block.payload().size() == 64);
    CHECK(block.options().block1().value() == BlockValue(0, true, 2));
    CHECK_FALSE(block.options().has(option::BLOCK2));
    CHECK(block.code() == code::POST);
    CHECK(block.type().value() == MessageType::Confirmable);

    REQUIRE(extract_block(big, 1, 2, block) == Status::Ok);
    CHECK(block.payload().size() == 36);
    CHECK(block.options().block1().value() == BlockValue(1, false, 2));

    CHECK(extract_block(big, 2, 2, block) == Status::NoBlock);
    CHECK(extract_block(big, 0, 8, block) == Status::ValueOutOfRange);
}

TEST_CASE("extract_block on an empty payload has no blocks") {
    Message empty(MessageType::Confirmable, code::GET, 1);
    Message block;
    CHECK(extract_block(empty, 0, 2, block) == Status::NoBlock);
}

// 40 bytes as 16 + 16 + 8 needs 16-byte blocks, i.e. szx 0.
TEST_CASE("request blocks reassemble in order") {
    Message acc = request_block(0, true, 0, 16, 10);
    REQUIRE(append_request_block(acc, request_block(1, true, 0, 16, 11)) == Status::Ok);
    REQUIRE(append_request_block(acc, request_block(2, false, 0, 8, 12)) == Status::Ok);

    CHECK(acc.payload().size() == 40);
    CHECK(acc.options().block1().value() == BlockValue(2, false, 0));
    CHECK(acc.message_id().value() == 12);
}

TEST_CASE("request reassembly adopts token and message ID and clears the hint") {
    Message acc = request_block(0, true, 0, 16, 10);
    acc.set_response_type(MessageType::Acknowledgement);

    Message next = request_block(1, false, 0, 4, 11);
    const uint8_t tok[] = {0x42};
    REQUIRE(next.set_token(tok, 1) == Status::Ok);

    REQUIRE(append_request_block(acc, next) == Status::Ok);
    CHECK(acc.token() == next.token());
    CHECK(acc.message_id().value() == 11);
    CHECK_FALSE(acc.response_type().has_value());
}

TEST_CASE("request reassembly rejects gaps and the wrong message kind") {
    Message acc = request_block(0, true, 0, 16, 10);

    CHECK(append_request_block(acc, request_block(2, true, 0, 16, 11)) == Status::BlockSequence);
    CHECK(append_request_block(acc, request_block(0, true, 0, 16, 11)) == Status::BlockSequence);
    CHECK(acc.payload().size() == 16);
    CHECK(acc.message_id().value() == 10);

    Message no_block(MessageType::Confirmable, code::PUT, 11);
    CHECK(append_request_block(acc, no_block) == Status::InvalidOperation);

    Message resp = response_block(0, true, 0, 16, 1);
    CHECK(append_request_block(resp, request_block(1, true, 0, 16, 11)) == Status::InvalidOperation);
}

TEST_CASE("response blocks reassemble while the ETag holds") {
    Message acc = response_block(0, true, 0, 16, 7);
    REQUIRE(append_response_block(acc, response_block(1, true, 0, 16, 7)) == Status::Ok);
    REQUIRE(append_response_block(acc, response_block(2, false, 0, 3, 7)) == Status::Ok);

    CHECK(acc.payload().size() == 35);
    CHECK(acc.options().block2().value() == BlockValue(2, false, 0));
    CHECK(acc.message_id().value() == 3);
}

TEST_CASE("response reassembly rejects a changed ETag even when contiguous") {
    Message acc = response_block(0, true, 0, 16, 7);
    CHECK(append_response_block(acc, response_block(1, true, 0, 16, 8)) == Status::ResourceChanged);
    CHECK(acc.payload().size() == 16);

    Message untagged(MessageType::Acknowledgement, code::CONTENT, 2);
    REQUIRE(untagged.options().set_block2(BlockValue(1, false, 0)) == Status::Ok);
    CHECK(append_response_block(acc, untagged) == Status::ResourceChanged);
}

TEST_CASE("response reassembly rejects gaps and non-responses") {
    Message acc = response_block(0, true, 0, 16, 7);
    CHECK(append_response_block(acc, response_block(3, true, 0, 16, 7)) == Status::BlockSequence);

    Message plain(MessageType::Acknowledgement, code::CONTENT, 2);
    CHECK(append_response_block(acc, plain) == Status::InvalidOperation);

    Message req = request_block(0, true, 0, 16, 1);
    CHECK(append_response_block(req, response_block(1, true, 0, 16, 7)) == Status::InvalidOperation);
}

TEST_CASE("next Block2 request renegotiates an oversized first block") {
    Message get(MessageType::Confirmable, code::GET, 0x0200);
    const char* path[] = {"big"};
    REQUIRE(get.options().set_uri_path(path, 1) == Status::Ok);
    REQUIRE(get.options().set_observe(etl::optional<uint32_t>(0u)) == Status::Ok);
    REQUIRE(get.options().set_block1(BlockValue(0, false, 2)) == Status::Ok);

    Message resp(MessageType::Acknowledgement, code::CONTENT, 0x0200);
    REQUIRE(resp.options().set_block2(BlockValue(0, true, 6)) == Status::Ok);

    Message next;
    REQUIRE(generate_next_block2_request(get, resp, next) == Status::Ok);
    CHECK(next.options().block2().value() == BlockValue(16, false, 2));
    CHECK_FALSE(next.options().has(option::BLOCK1));
    CHECK_FALSE(next.options().observe().has_value());
    CHECK_FALSE(next.message_id().has_value());
    CHECK(next.payload().empty());
    CHECK(next.options().has(option::URI_PATH));
}

TEST_CASE("transfer continues after renegotiating down from 1024-byte blocks") {
    Message get(MessageType::Confirmable, code::GET, 0x0300);
    Message acc = response_block(0, true, 6, 1024, 9);

    Message next;
    REQUIRE(generate_next_block2_request(get, acc, next) == Status::Ok);
    const BlockValue want = next.options().block2().value();
    CHECK(want == BlockValue(16, false, 2));

    REQUIRE(append_response_block(acc, response_block(want.block_number, true, 2, 64, 9)) == Status::Ok);
    REQUIRE(append_response_block(acc, response_block(17, false, 2, 10, 9)) == Status::Ok);
    CHECK(acc.payload().size() == 1024 + 64 + 10);
    CHECK(acc.options().block2().value() == BlockValue(17, false, 2));
}

TEST_CASE("bodies larger than one datagram reassemble from 2048-byte blocks") {
    Message big = body_message(code::CONTENT, 5000);
    Message block;
    REQUIRE(extract_block(big, 0, 7, block) == Status::Ok);
    CHECK(block.payload().size() == 2048);

    std::vector<uint8_t> wire(CW_DATAGRAM_MAX);
    size_t n = 0;
    block.set_message_id(uint16_t(1));
    REQUIRE(block.encode(wire.data(), wire.size(), n) == Status::Ok);
    Message acc;
    REQUIRE(acc.decode(wire.data(), n) == Status::Ok);

    for (uint32_t k = 1; extract_block(big, k, 7, block) == Status::Ok; ++k) {
        REQUIRE(append_response_block(acc, block) == Status::Ok);
    }
    CHECK(acc.payload() == big.payload());
    CHECK(acc.options().block2().value() == BlockValue(2, false, 7));
}

TEST_CASE("reassembly past the body capacity overflows without changing the accumulator") {
    REQUIRE(CW_BODY_MAX % 16 == 0);
    Message acc = body_message(code::CONTENT, CW_BODY_MAX);
    REQUIRE(acc.options().set_block2(BlockValue(0, true, 0)) == Status::Ok);

    Message next(MessageType::Acknowledgement, code::CONTENT, 2);
    const uint8_t bytes[16] = {};
    REQUIRE(next.set_payload(bytes, 16) == Status::Ok);
    REQUIRE(next.options().set_block2(BlockValue(CW_BODY_MAX / 16, false, 0)) == Status::Ok);

    CHECK(append_response_block(acc, next) == Status::Overflow);
    CHECK(acc.payload().size() == CW_BODY_MAX);
    CHECK(acc.options().block2().value() == BlockValue(0, true, 0));
    CHECK(acc.message_id().value() == 0x0100);
}

TEST_CASE("the preferred block size can be passed in") {
    Message get(MessageType::Confirmable, code::GET, 1);
    Message resp(MessageType::Acknowledgement, code::CONTENT, 1);
    REQUIRE(resp.options().set_block2(BlockValue(0, true, 6)) == Status::Ok);

    Message next;
    REQUIRE(generate_next_block2_request(get, resp, next, 4) == Status::Ok);
    CHECK(next.options().block2().value() == BlockValue(4, false, 4));

    REQUIRE(generate_next_block2_request(get, resp, next, 6) == Status::Ok);
    CHECK(next.options().block2().value() == BlockValue(1, false, 6));

    CHECK(generate_next_block2_request(get, resp, next, 8) == Status::ValueOutOfRange);

    Message first = request_block(0, true, 6, 16, 6);
    Message ack;
    REQUIRE(generate_next_block1_response(first, ack, 3) == Status::Ok);
    CHECK(ack.options().block1().value() == BlockValue(0, true, 3));
    REQUIRE(generate_next_block1_response(first, ack, 7) == Status::Ok);
    CHECK(ack.options().block1().value() == BlockValue(0, true, 6));
    CHECK(generate_next_block1_response(first, ack, 8) == Status::ValueOutOfRange);
}

TEST_CASE("next Block2 request follows on at the same size") {
    Message get(MessageType::Confirmable, code::GET, 1);
    Message resp(MessageType::Acknowledgement, code::CONTENT, 1);
    REQUIRE(resp.options().set_block2(BlockValue(3, true, 2)) == Status::Ok);

    Message next;
    REQUIRE(generate_next_block2_request(get, resp, next) == Status::Ok);
    CHECK(next.options().block2().value() == BlockValue(4, false, 2));

    Message bare(MessageType::Acknowledgement, code::CONTENT, 1);
    CHECK(generate_next_block2_request(get, bare, next) == Status::InvalidOperation);
}

TEST_CASE("Block1 acknowledgement echoes the block or asks for the default size") {
    Message req = request_block(3, true, 1, 32, 5);
    const uint8_t tok[] = {0x01, 0x02};
    REQUIRE(req.set_token(tok, 2) == Status::Ok);
    req.set_remote(Endpoint("198.51.100.4", 40000));

    Message ack;
    REQUIRE(generate_next_block1_response(req, ack) == Status::Ok);
    CHECK(ack.code() == code::CHANGED);
    CHECK(ack.token() == req.token());
    CHECK(ack.remote().value() == req.remote().value());
    CHECK(ack.options().block1().value() == BlockValue(3, true, 1));
    CHECK_FALSE(ack.type().has_value());
    CHECK_FALSE(ack.message_id().has_value());

    Message first = request_block(0, true, 6, 16, 6);
    REQUIRE(generate_next_block1_response(first, ack) == Status::Ok);
    CHECK(ack.options().block1().value() == BlockValue(0, true, 2));

    Message plain(MessageType::Confirmable, code::PUT, 7);
    CHECK(generate_next_block1_response(plain, ack) == Status::InvalidOperation);
}

TEST_CASE("split then reassemble restores the body") {
    Message big = body_message(code::CONTENT, 200);
    Message block;
    REQUIRE(extract_block(big, 0, 1, block) == Status::Ok);
    Message acc = block;

    for (uint32_t n = 1; extract_block(big, n, 1, block) == Status::Ok; ++n) {
        REQUIRE(append_response_block(acc, block) == Status::Ok);
    }
    CHECK(acc.payload() == big.payload());
    CHECK(acc.options().block2().value() == BlockValue(6, false, 1));
}
