/**
 * @file message.hpp
 * @brief CoAP Message: header, token, options and payload, with whole-datagram codec.
 *
 * A `Message` is the structured form of one CoAP datagram:
 *
 * ```
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |Ver| T |  TKL  |      Code     |          Message ID           |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |   Token (0..8 bytes) ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |   Options ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |1 1 1 1 1 1 1 1|    Payload ...   (marker only if payload is non-empty)
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * ```
 *
 * ### Unset fields
 * - `type` and `message_id` may be unset while a message is being built; the transport
 *   assigns them before sending. `encode()` refuses to run without them.
 * - `payload` is never absent. An empty payload means "no payload" and no marker byte.
 *
 * ### Non-wire state
 * - `remote`: the peer endpoint the message came from or is going to. Passed through
 *   untouched by the codec; blockwise helpers copy it to the messages they derive.
 * - `response_type`: a hint slot owned by the transport layer (the type it intends to
 *   answer with). The codec never reads it.
 *
 * @code
 * coapwire::Message req;
 * req.set_type(coapwire::MessageType::Confirmable);
 * req.set_code(coapwire::code::GET);
 * req.set_message_id(0x1234);
 * const char* path[] = {"sensors", "temp"};
 * req.options().set_uri_path(path, 2);
 *
 * uint8_t buf[coapwire::CW_DATAGRAM_MAX];
 * size_t n = 0;
 * if (req.encode(buf, sizeof(buf), n) == coapwire::Status::Ok) { send(buf, n); }
 * @endcode
 */
#ifndef COAPWIRE_MESSAGE_HPP
#define COAPWIRE_MESSAGE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/optional.h"
#include "etl/string.h"
#include "etl/vector.h"
#include "codes.hpp"
#include "config.hpp"
#include "options.hpp"
#include "status.hpp"

namespace coapwire {

/// Only protocol version this codec speaks.
static constexpr uint8_t COAP_VERSION = 1;

/// Fixed part of every datagram: version/type/TKL, code, message ID.
static constexpr size_t HEADER_SIZE = 4;

/// The byte that separates options from the payload.
static constexpr uint8_t PAYLOAD_MARKER = 0xFF;

using Token   = etl::vector<uint8_t, CW_TOKEN_MAX>;
using Payload = etl::vector<uint8_t, CW_BODY_MAX>;

/// Opaque peer address; the codec only stores and copies it.
struct Endpoint {
  etl::string<CW_HOST_MAX> host;
  uint16_t                 port{COAP_PORT};

  Endpoint() = default;
  Endpoint(const char* h, uint16_t p) : port(p) { if (h) host.assign(h); }

  bool operator==(const Endpoint& o) const { return host == o.host && port == o.port; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }
};

class Message {
public:
  Message() = default;

  /// Header-only construction; token, options and payload start empty.
  Message(MessageType type, uint8_t code, uint16_t message_id)
  : type_(type), code_(code), message_id_(message_id) {}

  // -------- Header --------

  uint8_t version() const { return COAP_VERSION; }

  const etl::optional<MessageType>& type() const { return type_; }
  void set_type(const etl::optional<MessageType>& t) { type_ = t; }

  uint8_t code() const { return code_; }
  void set_code(uint8_t c) { code_ = c; }

  const etl::optional<uint16_t>& message_id() const { return message_id_; }
  void set_message_id(const etl::optional<uint16_t>& mid) { message_id_ = mid; }

  bool is_empty() const      { return coapwire::is_empty(code_); }
  bool is_request() const    { return coapwire::is_request(code_); }
  bool is_response() const   { return coapwire::is_response(code_); }
  bool is_successful() const { return coapwire::is_successful(code_); }

  // -------- Token --------

  const Token& token() const { return token_; }
  void set_token(const Token& t) { token_ = t; }

  /// Overflow if @p len > 8.
  Status set_token(const uint8_t* data, size_t len);

  // -------- Options --------

  Options&       options()       { return options_; }
  const Options& options() const { return options_; }

  // -------- Payload --------

  const Payload& payload() const { return payload_; }

  /// Replace the payload. Overflow past CW_BODY_MAX.
  Status set_payload(const uint8_t* data, size_t len);
  Status set_payload(const char* text);

  /// Add bytes after the current payload. Overflow (and no change) if they do not fit.
  Status append_payload(const uint8_t* data, size_t len);

  void clear_payload() { payload_.clear(); }

  // -------- Non-wire state --------

  const etl::optional<Endpoint>& remote() const { return remote_; }
  void set_remote(const etl::optional<Endpoint>& r) { remote_ = r; }

  const etl::optional<MessageType>& response_type() const { return response_type_; }
  void set_response_type(const etl::optional<MessageType>& t) { response_type_ = t; }

  // -------- Codec --------

  /**
   * @brief Serialize the message.
   * @param out     Destination buffer.
   * @param cap     Capacity of @p out (CW_DATAGRAM_MAX suffices while the payload is
   *                within CW_PAYLOAD_MAX; larger bodies go out through extract_block()).
   * @param out_len Bytes written on success.
   * @return Ok; IncompleteMessage if type or message ID is unset; Overflow if @p cap is
   *         too small; ValueOutOfRange from the option codec.
   */
  Status encode(uint8_t* out, size_t cap, size_t& out_len) const;

  /**
   * @brief Replace this message by decoding one datagram.
   *
   * Checks run in wire order: length >= 4, version == 1 (FatalVersion, before anything
   * else is looked at), token length <= 8, token present, options, payload.
   *
   * @param data   Datagram bytes.
   * @param len    Datagram length.
   * @param remote Peer the datagram came from, stored as-is (may be nullptr).
   * @return Ok, FatalVersion, MalformedMessage or Overflow (an option value past
   *         CW_OPTION_VALUE_MAX, a payload past CW_PAYLOAD_MAX). On failure the message is
   *         left reset.
   */
  Status decode(const uint8_t* data, size_t len, const Endpoint* remote = nullptr);

  /// Back to a default-constructed message.
  void reset() { *this = Message(); }

  /// Compares wire content only; remote and response_type are ignored.
  bool operator==(const Message& o) const;
  bool operator!=(const Message& o) const { return !(*this == o); }

private:
  etl::optional<MessageType> type_;
  uint8_t                    code_{code::EMPTY};
  etl::optional<uint16_t>    message_id_;
  Token                      token_;
  Options                    options_;
  Payload                    payload_;
  etl::optional<Endpoint>    remote_;
  etl::optional<MessageType> response_type_;
};

} // namespace coapwire

#endif // COAPWIRE_MESSAGE_HPP
