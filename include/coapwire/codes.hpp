/**
 * @file codes.hpp
 * @brief CoAP registries: message types, codes, option numbers, media types.
 *
 * Codes are plain `uint8_t` values, not a closed enum: extension codes exist and a
 * decoder has to carry them through untouched. Classification is by numeric range:
 *
 * | Range   | Class                              |
 * |---------|------------------------------------|
 * | 0       | Empty                              |
 * | 1..31   | Request (GET, POST, PUT, DELETE..) |
 * | 64..191 | Response (2.xx, 4.xx, 5.xx)        |
 * | other   | Reserved                           |
 *
 * The wire value of a code is `class << 5 | detail`, so "2.05 Content" is 69.
 */
#ifndef COAPWIRE_CODES_HPP
#define COAPWIRE_CODES_HPP

#include <stdint.h>

namespace coapwire {

/// 2-bit message type field.
enum class MessageType : uint8_t {
  Confirmable     = 0,
  NonConfirmable  = 1,
  Acknowledgement = 2,
  Reset           = 3,
};

namespace code {
static constexpr uint8_t EMPTY  = 0;
static constexpr uint8_t GET    = 1;
static constexpr uint8_t POST   = 2;
static constexpr uint8_t PUT    = 3;
static constexpr uint8_t DELETE = 4;

static constexpr uint8_t CREATED  = 65;   // 2.01
static constexpr uint8_t DELETED  = 66;   // 2.02
static constexpr uint8_t VALID    = 67;   // 2.03
static constexpr uint8_t CHANGED  = 68;   // 2.04
static constexpr uint8_t CONTENT  = 69;   // 2.05
static constexpr uint8_t CONTINUE = 95;   // 2.31

static constexpr uint8_t BAD_REQUEST                = 128;
static constexpr uint8_t UNAUTHORIZED               = 129;
static constexpr uint8_t BAD_OPTION                 = 130;
static constexpr uint8_t FORBIDDEN                  = 131;
static constexpr uint8_t NOT_FOUND                  = 132;
static constexpr uint8_t METHOD_NOT_ALLOWED         = 133;
static constexpr uint8_t NOT_ACCEPTABLE             = 134;
static constexpr uint8_t REQUEST_ENTITY_INCOMPLETE  = 136;
static constexpr uint8_t PRECONDITION_FAILED        = 140;
static constexpr uint8_t REQUEST_ENTITY_TOO_LARGE   = 141;
static constexpr uint8_t UNSUPPORTED_MEDIA_TYPE     = 143;
static constexpr uint8_t INTERNAL_SERVER_ERROR      = 160;
static constexpr uint8_t NOT_IMPLEMENTED            = 161;
static constexpr uint8_t BAD_GATEWAY                = 162;
static constexpr uint8_t SERVICE_UNAVAILABLE        = 163;
static constexpr uint8_t GATEWAY_TIMEOUT            = 164;
static constexpr uint8_t PROXYING_NOT_SUPPORTED     = 165;
} // namespace code

namespace option {
static constexpr uint32_t IF_MATCH       = 1;
static constexpr uint32_t URI_HOST       = 3;
static constexpr uint32_t ETAG           = 4;
static constexpr uint32_t IF_NONE_MATCH  = 5;
static constexpr uint32_t OBSERVE        = 6;
static constexpr uint32_t URI_PORT       = 7;
static constexpr uint32_t LOCATION_PATH  = 8;
static constexpr uint32_t URI_PATH       = 11;
static constexpr uint32_t CONTENT_FORMAT = 12;
static constexpr uint32_t MAX_AGE        = 14;
static constexpr uint32_t URI_QUERY      = 15;
static constexpr uint32_t ACCEPT         = 17;
static constexpr uint32_t LOCATION_QUERY = 20;
static constexpr uint32_t BLOCK2         = 23;
static constexpr uint32_t BLOCK1         = 27;
static constexpr uint32_t SIZE2          = 28;
static constexpr uint32_t PROXY_URI      = 35;
static constexpr uint32_t PROXY_SCHEME   = 39;
static constexpr uint32_t SIZE1          = 60;
} // namespace option

namespace media_type {
static constexpr uint32_t TEXT_PLAIN   = 0;
static constexpr uint32_t LINK_FORMAT  = 40;
static constexpr uint32_t XML          = 41;
static constexpr uint32_t OCTET_STREAM = 42;
static constexpr uint32_t EXI          = 47;
static constexpr uint32_t JSON         = 50;
} // namespace media_type

inline bool is_empty(uint8_t c)      { return c == code::EMPTY; }
inline bool is_request(uint8_t c)    { return c >= 1 && c < 32; }
inline bool is_response(uint8_t c)   { return c >= 64 && c < 192; }
inline bool is_successful(uint8_t c) { return c >= 64 && c < 96; }

/// "CON", "NON", "ACK", "RST".
const char* type_name(MessageType t);

/// "GET" for requests, "2.05 Content" for registered responses, "EMPTY", else nullptr.
const char* code_name(uint8_t c);

/// Registered option name ("Uri-Path"), or nullptr for unregistered numbers.
const char* option_name(uint32_t number);

/// MIME type for a Content-Format / Accept value, or nullptr if unregistered.
const char* media_type_name(uint32_t content_format);

} // namespace coapwire

#endif // COAPWIRE_CODES_HPP
