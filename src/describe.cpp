// -----------------------------------------------------------------------------
// @file describe.cpp
// @brief key=value rendering of messages, statuses and hex for the Linux tools.
// -----------------------------------------------------------------------------
#include "coapwire/describe.hpp"

#include <sstream>        // std::ostringstream: one-line summaries
#include <iomanip>        // std::setw, std::setfill, std::hex
#include <cctype>         // std::isxdigit

namespace coapwire {

namespace {

// Registered option name as a key: "Max-Age" -> "max_age"; unknown -> "opt<N>".
std::string option_key(uint32_t number) {
  const char* name = option_name(number);
  if (!name) return "opt" + std::to_string(number);
  std::string key;
  for (const char* p = name; *p; ++p) {
    char c = *p;
    if (c == '-') c = '_';
    else if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    key.push_back(c);
  }
  return key;
}

bool printable(const OpaqueBytes& b) {
  for (uint8_t c : b) {
    if (c < 0x20 || c > 0x7E) return false;
  }
  return true;
}

// Spaces would split the key=value line, so code names use '_' ("2.05_Content").
std::string code_text(uint8_t c) {
  const char* name = code_name(c);
  if (!name) {
    std::ostringstream os;
    os << unsigned(c >> 5) << "." << std::setw(2) << std::setfill('0') << unsigned(c & 0x1F);
    return os.str();
  }
  std::string s(name);
  for (char& ch : s) if (ch == ' ') ch = '_';
  return s;
}

void append_value(std::ostringstream& os, uint32_t number, const OptionValue& v) {
  switch (v.format()) {
    case OptionFormat::Uint: {
      const char* media = nullptr;
      if (number == option::CONTENT_FORMAT || number == option::ACCEPT) {
        media = media_type_name(v.as_uint());
      }
      if (media) os << media;
      else       os << v.as_uint();
      break;
    }
    case OptionFormat::Block: {
      const BlockValue& b = v.as_block();
      os << b.block_number << "/" << (b.more ? 1 : 0) << "/" << b.block_size();
      break;
    }
    case OptionFormat::Opaque:
    default: {
      const OpaqueBytes& b = v.bytes();
      if (!b.empty() && printable(b)) os << std::string(b.begin(), b.end());
      else                            os << "0x" << hex_string(b.data(), b.size());
      break;
    }
  }
}

// Uri-Query segments joined with "&".
std::string join_query(const SegmentList& segments) {
  std::string s;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i) s += "&";
    s.append(segments[i].c_str(), segments[i].size());
  }
  return s;
}

} // namespace

std::string uri_path_string(const SegmentList& segments) {
  std::string s;
  for (const auto& seg : segments) {
    s += "/";
    s.append(seg.c_str(), seg.size());
  }
  if (s.empty()) s = "/";
  return s;
}

std::string uri_path_string(const Message& msg) {
  SegmentList segments;
  if (msg.options().uri_path(segments) != Status::Ok) return "/";
  return uri_path_string(segments);
}

std::string hex_string(const uint8_t* data, size_t len) {
  std::ostringstream os;
  os << std::hex << std::setfill('0');
  for (size_t i = 0; i < len; ++i) os << std::setw(2) << unsigned(data[i]);
  return os.str();
}

bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  std::string digits;
  size_t i = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) i = 2;
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ':') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    digits.push_back(c);
  }
  if (digits.size() % 2 != 0) return false;

  out.reserve(digits.size() / 2);
  for (size_t k = 0; k < digits.size(); k += 2) {
    out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(k, 2), nullptr, 16)));
  }
  return true;
}

std::string describe_status(Status s) {
  if (s == Status::Ok) return "status=ok";
  std::ostringstream os;
  os << "status=error reason=" << status_name(s);
  return os.str();
}

std::string describe(const Message& msg) {
  std::ostringstream os;
  os << "status=ok";

  if (msg.type().has_value()) os << " type=" << type_name(msg.type().value());
  os << " code=" << code_text(msg.code());
  if (msg.message_id().has_value()) os << " mid=" << msg.message_id().value();
  if (!msg.token().empty()) os << " token=" << hex_string(msg.token().data(), msg.token().size());

  const Options& opts = msg.options();
  if (opts.has(option::URI_PATH)) os << " path=" << uri_path_string(msg);

  SegmentList query;
  if (opts.has(option::URI_QUERY) && opts.uri_query(query) == Status::Ok) {
    os << " query=" << join_query(query);
  }

  for (size_t i = 0; i < opts.size(); ++i) {
    const OptionEntry& e = opts[i];
    if (e.number == option::URI_PATH || e.number == option::URI_QUERY) continue;
    os << " " << option_key(e.number) << "=";
    append_value(os, e.number, e.value);
  }

  if (!msg.payload().empty()) os << " payload_len=" << msg.payload().size();
  if (msg.remote().has_value()) {
    os << " remote=" << msg.remote().value().host.c_str() << ":" << msg.remote().value().port;
  }
  return os.str();
}

} // namespace coapwire
