/**
 * @file message_json.hpp
 * @brief Command-line text to codec values, and Message to JSON, for coapwire-cli.
 *
 * JSON form of a message (`decode --format json`):
 * ```
 * {"version": 1, "type": "CON", "code": 1, "code_name": "GET", "mid": 4660,
 *  "token": "aabb", "options": [{"number": 11, "name": "Uri-Path", "value": "74656d70"}],
 *  "path": "/temp", "payload": ""}
 * ```
 * Unset type, message ID and unregistered names are `null`. Uint options are numbers,
 * Block options are `{"num", "more", "szx"}` objects, everything else is hex.
 */
#ifndef COAPWIRE_CLI_MESSAGE_JSON_HPP
#define COAPWIRE_CLI_MESSAGE_JSON_HPP

#include <cstdint>
#include <string>
#include "nlohmann/json.hpp"
#include "coapwire/message.hpp"

namespace coapwire {
namespace cli {

/// "CON", "NON", "ACK" or "RST". false for anything else; @p out untouched.
bool parse_type(const std::string& s, MessageType& out);

/**
 * @brief Parse a message code.
 *
 * Accepts "GET", "POST", "PUT", "DELETE", a dotted class.detail ("2.05", class 0..7,
 * detail 0..31) or a plain number 0..255.
 * @return false on anything else; @p out untouched.
 */
bool parse_code(const std::string& s, uint8_t& out);

nlohmann::json message_to_json(const Message& m);

} // namespace cli
} // namespace coapwire

#endif // COAPWIRE_CLI_MESSAGE_JSON_HPP
