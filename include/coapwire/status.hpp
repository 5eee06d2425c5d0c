/**
 * @file status.hpp
 * @brief Result codes returned by every coapwire operation.
 *
 * The codec never throws. Each operation returns a `Status`; anything other than
 * `Status::Ok` means the operation had no effect the caller may rely on.
 *
 * | Status            | Raised when                                                  |
 * |-------------------|--------------------------------------------------------------|
 * | FatalVersion      | decoded header version != 1; drop the datagram                |
 * | MalformedMessage  | truncated header/token/option, bad nibble, length past end    |
 * | IncompleteMessage | encode() without a type or message ID                         |
 * | ValueOutOfRange   | option delta/length >= 65804, block field out of range        |
 * | BlockSequence     | appended block does not start at the accumulated length       |
 * | ResourceChanged   | ETag differs between response blocks                          |
 * | InvalidOperation  | request-only/response-only call on the wrong kind of message  |
 * | Overflow          | a fixed capacity or the caller's output buffer is too small   |
 * | NoBlock           | extract_block() asked for a block past the end of the payload |
 */
#ifndef COAPWIRE_STATUS_HPP
#define COAPWIRE_STATUS_HPP

#include <stdint.h>

namespace coapwire {

enum class Status : uint8_t {
  Ok = 0,
  FatalVersion,
  MalformedMessage,
  IncompleteMessage,
  ValueOutOfRange,
  BlockSequence,
  ResourceChanged,
  InvalidOperation,
  Overflow,
  NoBlock,
};

/// Stable snake_case name, used as the `reason=` value in logs.
const char* status_name(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace coapwire

#endif // COAPWIRE_STATUS_HPP
