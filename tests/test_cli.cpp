#include <doctest/doctest.h>
#include <string>
#include "coapwire/message.hpp"
#include "message_json.hpp"

using namespace coapwire;
using json = nlohmann::json;

TEST_CASE("type names parse to message types") {
    MessageType t = MessageType::Reset;
    REQUIRE(cli::parse_type("CON", t));
    CHECK(t == MessageType::Confirmable);
    REQUIRE(cli::parse_type("ACK", t));
    CHECK(t == MessageType::Acknowledgement);

    CHECK_FALSE(cli::parse_type("con", t));
    CHECK_FALSE(cli::parse_type("", t));
    CHECK(t == MessageType::Acknowledgement);
}

TEST_CASE("codes parse from method names, c.dd and plain numbers") {
    uint8_t c = 0;
    REQUIRE(cli::parse_code("PUT", c));
    CHECK(c == code::PUT);

    REQUIRE(cli::parse_code("2.05", c));
    CHECK(c == code::CONTENT);
    REQUIRE(cli::parse_code("4.04", c));
    CHECK(c == code::NOT_FOUND);
    REQUIRE(cli::parse_code("7.31", c));
    CHECK(c == 0xFF);

    REQUIRE(cli::parse_code("69", c));
    CHECK(c == code::CONTENT);
    REQUIRE(cli::parse_code("0", c));
    CHECK(c == code::EMPTY);
}

TEST_CASE("out-of-range and malformed codes are refused") {
    uint8_t c = 42;
    CHECK_FALSE(cli::parse_code("8.00", c));
    CHECK_FALSE(cli::parse_code("2.32", c));
    CHECK_FALSE(cli::parse_code("256", c));
    CHECK_FALSE(cli::parse_code("2.", c));
    CHECK_FALSE(cli::parse_code(".05", c));
    CHECK_FALSE(cli::parse_code("-1", c));
    CHECK_FALSE(cli::parse_code("2.05x", c));
    CHECK_FALSE(cli::parse_code("FETCH", c));
    CHECK_FALSE(cli::parse_code("", c));
    CHECK(c == 42);
}

TEST_CASE("message JSON carries header, options and payload") {
    Message m(MessageType::Confirmable, code::GET, 0x1234);
    const uint8_t tok[] = {0xAA, 0xBB};
    REQUIRE(m.set_token(tok, 2) == Status::Ok);
    const char* path[] = {"temp"};
    REQUIRE(m.options().set_uri_path(path, 1) == Status::Ok);
    REQUIRE(m.options().set_accept(etl::optional<uint32_t>(media_type::JSON)) == Status::Ok);
    REQUIRE(m.options().set_block2(BlockValue(3, true, 2)) == Status::Ok);
    REQUIRE(m.set_payload("hi") == Status::Ok);

    json j = cli::message_to_json(m);
    CHECK(j["version"].get<unsigned>() == 1);
    CHECK(j["type"].get<std::string>() == "CON");
    CHECK(j["code"].get<unsigned>() == code::GET);
    CHECK(j["code_name"].get<std::string>() == "GET");
    CHECK(j["mid"].get<unsigned>() == 0x1234);
    CHECK(j["token"].get<std::string>() == "aabb");
    CHECK(j["path"].get<std::string>() == "/temp");
    CHECK(j["payload"].get<std::string>() == "6869");

    const json& opts = j["options"];
    REQUIRE(opts.size() == 3);
    CHECK(opts[0]["number"].get<unsigned>() == option::URI_PATH);
    CHECK(opts[0]["name"].get<std::string>() == "Uri-Path");
    CHECK(opts[0]["value"].get<std::string>() == "74656d70");
    CHECK(opts[1]["number"].get<unsigned>() == option::ACCEPT);
    CHECK(opts[1]["value"].get<unsigned>() == media_type::JSON);
    CHECK(opts[2]["number"].get<unsigned>() == option::BLOCK2);
    CHECK(opts[2]["value"]["num"].get<unsigned>() == 3);
    CHECK(opts[2]["value"]["more"].get<bool>());
    CHECK(opts[2]["value"]["szx"].get<unsigned>() == 2);
}

TEST_CASE("unset fields and unknown names render as null") {
    Message m;
    m.set_code(0x5E);
    OptionValue v;
    REQUIRE(OptionValue::make_string("x", v) == Status::Ok);
    REQUIRE(m.options().add_option(65000, v) == Status::Ok);

    json j = cli::message_to_json(m);
    CHECK(j["type"].is_null());
    CHECK(j["mid"].is_null());
    CHECK(j["code_name"].is_null());
    CHECK(j["token"].get<std::string>() == "");
    CHECK(j["options"][0]["name"].is_null());
    CHECK(j["options"][0]["value"].get<std::string>() == "78");
    CHECK(j["path"].get<std::string>() == "/");
}
