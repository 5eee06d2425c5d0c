/**
 * @file params_json.hpp
 * @brief TransmissionParams <-> JSON for the command line tool.
 *
 * The JSON form is a flat object keyed by parameter name. Reading accepts only the base
 * parameters; writing emits base and derived values:
 * ```
 * {"ack_timeout": 2.0, "max_retransmit": 4, ..., "exchange_lifetime": 247.0}
 * ```
 */
#ifndef COAPWIRE_CLI_PARAMS_JSON_HPP
#define COAPWIRE_CLI_PARAMS_JSON_HPP

#include <string>
#include "nlohmann/json.hpp"
#include "coapwire/config.hpp"

namespace coapwire {
namespace cli {

/**
 * @brief Override base values of @p p from JSON text.
 * @param text   JSON object text.
 * @param p      Parameters to update; untouched keys keep their value.
 * @param reason Set on failure: "bad_json", "unknown_key_<k>" or "value_out_of_range".
 * @return true on success. On failure @p p is unchanged.
 */
bool params_from_json(const std::string& text, TransmissionParams& p, std::string& reason);

/// Base and derived values.
nlohmann::json params_to_json(const TransmissionParams& p);

} // namespace cli
} // namespace coapwire

#endif // COAPWIRE_CLI_PARAMS_JSON_HPP
