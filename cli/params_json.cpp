// -----------------------------------------------------------------------------
// @file params_json.cpp
// @brief JSON overrides and dump of the transmission parameters.
// -----------------------------------------------------------------------------
#include "params_json.hpp"
#include "coapwire/option_value.hpp"

using json = nlohmann::json;

namespace coapwire {
namespace cli {

bool params_from_json(const std::string& text, TransmissionParams& p, std::string& reason) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error&) {
    reason = "bad_json";
    return false;
  }
  if (!j.is_object()) { reason = "bad_json"; return false; }

  // work on a copy so a rejected file changes nothing
  TransmissionParams q = p;
  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string& k = it.key();
      if (!it.value().is_number()) { reason = "bad_json"; return false; }

      if      (k == "ack_timeout")       q.ack_timeout       = it.value().get<double>();
      else if (k == "ack_random_factor") q.ack_random_factor = it.value().get<double>();
      else if (k == "default_leisure")   q.default_leisure   = it.value().get<double>();
      else if (k == "probing_rate")      q.probing_rate      = it.value().get<double>();
      else if (k == "max_latency")       q.max_latency       = it.value().get<double>();
      else if (k == "empty_ack_delay")   q.empty_ack_delay   = it.value().get<double>();
      else if (k == "max_retransmit" || k == "nstart" || k == "default_block_size_exponent") {
        if (!it.value().is_number_unsigned()) { reason = "value_out_of_range"; return false; }
        const unsigned v = it.value().get<unsigned>();
        if (k == "max_retransmit") {
          if (v > 16) { reason = "value_out_of_range"; return false; }
          q.max_retransmit = static_cast<uint8_t>(v);
        } else if (k == "nstart") {
          if (v < 1 || v > 255) { reason = "value_out_of_range"; return false; }
          q.nstart = static_cast<uint8_t>(v);
        } else {
          if (v > BLOCK_EXPONENT_MAX) { reason = "value_out_of_range"; return false; }
          q.default_block_size_exponent = static_cast<uint8_t>(v);
        }
      }
      else { reason = "unknown_key_" + k; return false; }
    }
  } catch (const json::type_error&) {
    reason = "bad_json";
    return false;
  }

  if (q.ack_timeout <= 0.0 || q.ack_random_factor < 1.0) {
    reason = "value_out_of_range";
    return false;
  }
  p = q;
  return true;
}

json params_to_json(const TransmissionParams& p) {
  json j;
  j["ack_timeout"]                 = p.ack_timeout;
  j["ack_random_factor"]           = p.ack_random_factor;
  j["max_retransmit"]              = p.max_retransmit;
  j["nstart"]                      = p.nstart;
  j["default_leisure"]             = p.default_leisure;
  j["probing_rate"]                = p.probing_rate;
  j["max_latency"]                 = p.max_latency;
  j["empty_ack_delay"]             = p.empty_ack_delay;
  j["default_block_size_exponent"] = p.default_block_size_exponent;
  j["max_transmit_span"]           = p.max_transmit_span();
  j["max_transmit_wait"]           = p.max_transmit_wait();
  j["processing_delay"]            = p.processing_delay();
  j["max_rtt"]                     = p.max_rtt();
  j["exchange_lifetime"]           = p.exchange_lifetime();
  j["non_lifetime"]                = p.non_lifetime();
  j["request_timeout"]             = p.request_timeout();
  return j;
}

} // namespace cli
} // namespace coapwire
