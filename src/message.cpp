// -----------------------------------------------------------------------------
// @file message.cpp
// @brief CoAP Message header packing and whole-datagram encode/decode.
//
// Header byte 0 packs three fields:
//   bits 7-6  version (always 1)
//   bits 5-4  type
//   bits 3-0  token length
// Bytes 1..3 are the code and the big-endian message ID.
// -----------------------------------------------------------------------------
#include "coapwire/message.hpp"
#include <string.h>

namespace coapwire {

// =============================================================================
// Token / payload
// =============================================================================

Status Message::set_token(const uint8_t* data, size_t len) {
  if (len > CW_TOKEN_MAX) return Status::Overflow;
  token_.clear();
  if (len > 0) token_.assign(data, data + len);
  return Status::Ok;
}

Status Message::set_payload(const uint8_t* data, size_t len) {
  if (len > CW_BODY_MAX) return Status::Overflow;
  payload_.clear();
  if (len > 0) payload_.assign(data, data + len);
  return Status::Ok;
}

Status Message::set_payload(const char* text) {
  const size_t n = text ? ::strlen(text) : 0;
  return set_payload(reinterpret_cast<const uint8_t*>(text), n);
}

Status Message::append_payload(const uint8_t* data, size_t len) {
  if (len > payload_.available()) return Status::Overflow;
  if (len > 0) payload_.insert(payload_.end(), data, data + len);
  return Status::Ok;
}

// =============================================================================
// Encode
// =============================================================================

Status Message::encode(uint8_t* out, size_t cap, size_t& out_len) const {
  if (!type_.has_value() || !message_id_.has_value()) return Status::IncompleteMessage;
  if (cap < HEADER_SIZE + token_.size()) return Status::Overflow;

  const uint16_t mid = message_id_.value();
  out[0] = static_cast<uint8_t>((COAP_VERSION << 6) |
                                (static_cast<uint8_t>(type_.value()) << 4) |
                                (token_.size() & 0x0F));
  out[1] = code_;
  out[2] = static_cast<uint8_t>((mid >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(mid & 0xFF);

  size_t pos = HEADER_SIZE;
  if (!token_.empty()) {
    ::memcpy(out + pos, token_.data(), token_.size());
    pos += token_.size();
  }

  size_t opt_len = 0;
  const Status st = options_.encode(out + pos, cap - pos, opt_len);
  if (st != Status::Ok) return st;
  pos += opt_len;

  if (!payload_.empty()) {
    if (1 + payload_.size() > cap - pos) return Status::Overflow;
    out[pos++] = PAYLOAD_MARKER;
    ::memcpy(out + pos, payload_.data(), payload_.size());
    pos += payload_.size();
  }

  out_len = pos;
  return Status::Ok;
}

// =============================================================================
// Decode
// =============================================================================

Status Message::decode(const uint8_t* data, size_t len, const Endpoint* remote) {
  reset();

  if (len < HEADER_SIZE) return Status::MalformedMessage;

  // version first: a datagram from another protocol version is dropped unread
  const uint8_t version = static_cast<uint8_t>(data[0] >> 6);
  if (version != COAP_VERSION) return Status::FatalVersion;

  const uint8_t tkl = static_cast<uint8_t>(data[0] & 0x0F);
  if (tkl > CW_TOKEN_MAX) return Status::MalformedMessage;          // 9..15 are reserved
  if (len - HEADER_SIZE < tkl) return Status::MalformedMessage;

  type_       = static_cast<MessageType>((data[0] >> 4) & 0x03);
  code_       = data[1];
  message_id_ = static_cast<uint16_t>((data[2] << 8) | data[3]);

  size_t pos = HEADER_SIZE;
  token_.assign(data + pos, data + pos + tkl);
  pos += tkl;

  size_t payload_offset = 0;
  Status st = options_.decode(data + pos, len - pos, payload_offset);
  if (st != Status::Ok) {
    reset();
    return st;
  }
  pos += payload_offset;
  if (len - pos > CW_PAYLOAD_MAX) {
    reset();
    return Status::Overflow;
  }

  st = set_payload(data + pos, len - pos);
  if (st != Status::Ok) {
    reset();
    return st;
  }

  if (remote) remote_ = *remote;
  return Status::Ok;
}

bool Message::operator==(const Message& o) const {
  return type_ == o.type_ &&
         code_ == o.code_ &&
         message_id_ == o.message_id_ &&
         token_ == o.token_ &&
         options_ == o.options_ &&
         payload_ == o.payload_;
}

} // namespace coapwire
