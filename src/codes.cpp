// -----------------------------------------------------------------------------
// @file codes.cpp
// @brief Name tables for the CoAP registries declared in codes.hpp.
//
// Plain switch tables: no allocation, no lookup structures, safe on MCUs.
// -----------------------------------------------------------------------------
#include "coapwire/codes.hpp"
#include "coapwire/status.hpp"

namespace coapwire {

const char* type_name(MessageType t) {
  switch (t) {
    case MessageType::Confirmable:     return "CON";
    case MessageType::NonConfirmable:  return "NON";
    case MessageType::Acknowledgement: return "ACK";
    case MessageType::Reset:           return "RST";
  }
  return "?";
}

const char* code_name(uint8_t c) {
  switch (c) {
    case code::EMPTY:                     return "EMPTY";
    case code::GET:                       return "GET";
    case code::POST:                      return "POST";
    case code::PUT:                       return "PUT";
    case code::DELETE:                    return "DELETE";
    case code::CREATED:                   return "2.01 Created";
    case code::DELETED:                   return "2.02 Deleted";
    case code::VALID:                     return "2.03 Valid";
    case code::CHANGED:                   return "2.04 Changed";
    case code::CONTENT:                   return "2.05 Content";
    case code::CONTINUE:                  return "2.31 Continue";
    case code::BAD_REQUEST:               return "4.00 Bad Request";
    case code::UNAUTHORIZED:              return "4.01 Unauthorized";
    case code::BAD_OPTION:                return "4.02 Bad Option";
    case code::FORBIDDEN:                 return "4.03 Forbidden";
    case code::NOT_FOUND:                 return "4.04 Not Found";
    case code::METHOD_NOT_ALLOWED:        return "4.05 Method Not Allowed";
    case code::NOT_ACCEPTABLE:            return "4.06 Not Acceptable";
    case code::REQUEST_ENTITY_INCOMPLETE: return "4.08 Request Entity Incomplete";
    case code::PRECONDITION_FAILED:       return "4.12 Precondition Failed";
    case code::REQUEST_ENTITY_TOO_LARGE:  return "4.13 Request Entity Too Large";
    case code::UNSUPPORTED_MEDIA_TYPE:    return "4.15 Unsupported Media Type";
    case code::INTERNAL_SERVER_ERROR:     return "5.00 Internal Server Error";
    case code::NOT_IMPLEMENTED:           return "5.01 Not Implemented";
    case code::BAD_GATEWAY:               return "5.02 Bad Gateway";
    case code::SERVICE_UNAVAILABLE:       return "5.03 Service Unavailable";
    case code::GATEWAY_TIMEOUT:           return "5.04 Gateway Timeout";
    case code::PROXYING_NOT_SUPPORTED:    return "5.05 Proxying Not Supported";
    default:                              return nullptr;
  }
}

const char* option_name(uint32_t number) {
  switch (number) {
    case option::IF_MATCH:       return "If-Match";
    case option::URI_HOST:       return "Uri-Host";
    case option::ETAG:           return "ETag";
    case option::IF_NONE_MATCH:  return "If-None-Match";
    case option::OBSERVE:        return "Observe";
    case option::URI_PORT:       return "Uri-Port";
    case option::LOCATION_PATH:  return "Location-Path";
    case option::URI_PATH:       return "Uri-Path";
    case option::CONTENT_FORMAT: return "Content-Format";
    case option::MAX_AGE:        return "Max-Age";
    case option::URI_QUERY:      return "Uri-Query";
    case option::ACCEPT:         return "Accept";
    case option::LOCATION_QUERY: return "Location-Query";
    case option::BLOCK2:         return "Block2";
    case option::BLOCK1:         return "Block1";
    case option::SIZE2:          return "Size2";
    case option::PROXY_URI:      return "Proxy-Uri";
    case option::PROXY_SCHEME:   return "Proxy-Scheme";
    case option::SIZE1:          return "Size1";
    default:                     return nullptr;
  }
}

const char* media_type_name(uint32_t content_format) {
  switch (content_format) {
    case media_type::TEXT_PLAIN:   return "text/plain";
    case media_type::LINK_FORMAT:  return "application/link-format";
    case media_type::XML:          return "application/xml";
    case media_type::OCTET_STREAM: return "application/octet-stream";
    case media_type::EXI:          return "application/exi";
    case media_type::JSON:         return "application/json";
    default:                       return nullptr;
  }
}

const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:                return "ok";
    case Status::FatalVersion:      return "fatal_version";
    case Status::MalformedMessage:  return "malformed_message";
    case Status::IncompleteMessage: return "incomplete_message";
    case Status::ValueOutOfRange:   return "value_out_of_range";
    case Status::BlockSequence:     return "block_sequence";
    case Status::ResourceChanged:   return "resource_changed";
    case Status::InvalidOperation:  return "invalid_operation";
    case Status::Overflow:          return "overflow";
    case Status::NoBlock:           return "no_block";
  }
  return "unknown";
}

} // namespace coapwire
