/**
 * @file describe.hpp
 * @brief Shell-friendly rendering of messages and statuses (Linux side).
 *
 * Everything here produces one-line `key=value` text, the same shape the command line
 * tools print and scripts grep for:
 *
 * ```
 * status=ok type=CON code=GET mid=4660 token=0a0b path=/sensors/temp accept=application/json
 * status=ok type=ACK code=2.05_Content mid=4660 token=0a0b block2=0/1/64 payload_len=64
 * status=error reason=malformed_message
 * ```
 *
 * Formatting rules for options (in wire order, Uri-Path / Uri-Query folded into `path=` /
 * `query=`):
 *  - key is the registered name lower-cased with `-` turned into `_` (`max_age`), or
 *    `opt<N>` for unregistered numbers;
 *  - Uint values print in decimal; Content-Format and Accept print the media type when known;
 *  - Block values print as `num/more/size` (`2/1/64`);
 *  - Opaque values print as text if every byte is printable ASCII, else as `0x` + hex.
 *
 * Uses std::string; not meant for MCU builds.
 */
#ifndef COAPWIRE_DESCRIBE_HPP
#define COAPWIRE_DESCRIBE_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "message.hpp"
#include "options.hpp"
#include "status.hpp"

namespace coapwire {

/// "/" + segments joined by "/" ("/" for an empty list).
std::string uri_path_string(const SegmentList& segments);

/// Uri-Path of @p msg as "/a/b".
std::string uri_path_string(const Message& msg);

/// Lower-case hex, no separators.
std::string hex_string(const uint8_t* data, size_t len);

/// Parse hex text (whitespace and an optional "0x" prefix allowed). False on bad input.
bool parse_hex(const std::string& text, std::vector<uint8_t>& out);

/// One-line summary of a message, starting with "status=ok".
std::string describe(const Message& msg);

/// "status=ok" or "status=error reason=<status_name>".
std::string describe_status(Status s);

} // namespace coapwire

#endif // COAPWIRE_DESCRIBE_HPP
