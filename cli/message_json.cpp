// -----------------------------------------------------------------------------
// @file message_json.cpp
// @brief Type/code parsing and JSON rendering of decoded messages.
// -----------------------------------------------------------------------------
#include "message_json.hpp"
#include "coapwire/describe.hpp"

using json = nlohmann::json;

namespace coapwire {
namespace cli {

namespace {

// Whole string of decimal digits, at most 3 of them.
bool parse_small_number(const std::string& s, unsigned& out) {
  if (s.empty() || s.size() > 3) return false;
  unsigned v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<unsigned>(c - '0');
  }
  out = v;
  return true;
}

json option_value_json(const OptionValue& v) {
  switch (v.format()) {
    case OptionFormat::Uint:
      return json(v.as_uint());
    case OptionFormat::Block: {
      const BlockValue& b = v.as_block();
      json o;
      o["num"] = b.block_number;
      o["more"] = b.more;
      o["szx"] = b.size_exponent;
      return o;
    }
    case OptionFormat::Opaque:
    default:
      return json(hex_string(v.bytes().data(), v.bytes().size()));
  }
}

} // namespace

bool parse_type(const std::string& s, MessageType& out) {
  if (s == "CON") { out = MessageType::Confirmable;     return true; }
  if (s == "NON") { out = MessageType::NonConfirmable;  return true; }
  if (s == "ACK") { out = MessageType::Acknowledgement; return true; }
  if (s == "RST") { out = MessageType::Reset;           return true; }
  return false;
}

bool parse_code(const std::string& s, uint8_t& out) {
  if (s == "GET")    { out = code::GET;    return true; }
  if (s == "POST")   { out = code::POST;   return true; }
  if (s == "PUT")    { out = code::PUT;    return true; }
  if (s == "DELETE") { out = code::DELETE; return true; }

  const size_t dot = s.find('.');
  if (dot != std::string::npos) {
    unsigned cls = 0;
    unsigned detail = 0;
    if (!parse_small_number(s.substr(0, dot), cls)) return false;
    if (!parse_small_number(s.substr(dot + 1), detail)) return false;
    if (cls > 7 || detail > 31) return false;
    out = static_cast<uint8_t>((cls << 5) | detail);
    return true;
  }

  unsigned v = 0;
  if (!parse_small_number(s, v) || v > 255) return false;
  out = static_cast<uint8_t>(v);
  return true;
}

json message_to_json(const Message& m) {
  json j;
  j["version"] = m.version();
  if (m.type().has_value()) j["type"] = type_name(m.type().value());
  else                      j["type"] = nullptr;
  const char* cname = code_name(m.code());
  j["code"] = m.code();
  j["code_name"] = cname ? json(cname) : json(nullptr);
  if (m.message_id().has_value()) j["mid"] = m.message_id().value();
  else                            j["mid"] = nullptr;
  j["token"] = hex_string(m.token().data(), m.token().size());

  json opts = json::array();
  for (size_t i = 0; i < m.options().size(); ++i) {
    const OptionEntry& e = m.options()[i];
    const char* oname = option_name(e.number);
    json o;
    o["number"] = e.number;
    o["name"] = oname ? json(oname) : json(nullptr);
    o["value"] = option_value_json(e.value);
    opts.push_back(o);
  }
  j["options"] = opts;
  j["path"] = uri_path_string(m);
  j["payload"] = hex_string(m.payload().data(), m.payload().size());
  return j;
}

} // namespace cli
} // namespace coapwire
