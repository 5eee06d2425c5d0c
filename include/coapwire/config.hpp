/**
 * @file config.hpp
 * @brief coapwire tunables: fixed capacities and CoAP transmission parameters.
 *
 * Two kinds of configuration live here:
 *
 *  - **Capacities** (`CW_*`): every container in the codec is a fixed-capacity ETL
 *    container, so the largest token, option value, option count and payload are
 *    compile-time constants. Going past one of them is reported as `Status::Overflow`,
 *    never as silent truncation. The three large ones (`CW_OPTION_VALUE_MAX`,
 *    `CW_PAYLOAD_MAX`, `CW_BODY_MAX`) can be set from the build, e.g.
 *    `-DCW_BODY_MAX=65536`.
 *
 *  - **Transmission parameters** (RFC 7252 §4.8): timing values the codec itself never
 *    uses. They are published here because the transport layer that drives retransmission
 *    and exchange lifetimes needs one agreed-upon source for them.
 *
 * | Parameter          | Default | Derived from                                         |
 * |--------------------|---------|------------------------------------------------------|
 * | ACK_TIMEOUT        | 2 s     |                                                      |
 * | ACK_RANDOM_FACTOR  | 1.5     |                                                      |
 * | MAX_RETRANSMIT     | 4       |                                                      |
 * | NSTART             | 1       |                                                      |
 * | DEFAULT_LEISURE    | 5 s     |                                                      |
 * | PROBING_RATE       | 1 B/s   |                                                      |
 * | MAX_LATENCY        | 100 s   |                                                      |
 * | MAX_TRANSMIT_SPAN  | 45 s    | ACK_TIMEOUT * (2^MAX_RETRANSMIT - 1) * RANDOM_FACTOR |
 * | MAX_TRANSMIT_WAIT  | 93 s    | ACK_TIMEOUT * (2^(MAX_RETRANSMIT+1) - 1) * FACTOR    |
 * | PROCESSING_DELAY   | 2 s     | ACK_TIMEOUT                                          |
 * | MAX_RTT            | 202 s   | 2 * MAX_LATENCY + PROCESSING_DELAY                   |
 * | EXCHANGE_LIFETIME  | 247 s   | MAX_TRANSMIT_SPAN + MAX_RTT                          |
 * | NON_LIFETIME       | 145 s   | MAX_TRANSMIT_SPAN + MAX_LATENCY                      |
 *
 * The defaults fit a Linux host. MCU builds usually lower `CW_OPTION_VALUE_MAX` and
 * `CW_BODY_MAX`; a `Message` holds `CW_OPTIONS_MAX` option values plus one body.
 */
#ifndef COAPWIRE_CONFIG_HPP
#define COAPWIRE_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>

// Largest opaque/string option value. RFC 7252 allows Proxy-Uri up to 1034 bytes.
#ifndef CW_OPTION_VALUE_MAX
#define CW_OPTION_VALUE_MAX 1034
#endif

// Payload of one datagram. 2048 is the largest block (szx 7).
#ifndef CW_PAYLOAD_MAX
#define CW_PAYLOAD_MAX 2048
#endif

// Payload a Message can hold, i.e. the largest body blockwise reassembly can build.
#ifndef CW_BODY_MAX
#define CW_BODY_MAX 16384
#endif

namespace coapwire {

static_assert(CW_BODY_MAX >= CW_PAYLOAD_MAX, "a body must hold at least one datagram payload");

// Capacities: every ETL container in the codec is sized from these and the hooks above.
static constexpr size_t CW_TOKEN_MAX        = 8;    ///< RFC 7252 token limit
static constexpr size_t CW_OPTIONS_MAX      = 24;   ///< Option instances per message
static constexpr size_t CW_SEGMENT_MAX      = 255;  ///< One Uri-Path / Uri-Query segment
static constexpr size_t CW_SEGMENTS_MAX     = 8;    ///< Segments per path or query
static constexpr size_t CW_ETAGS_MAX        = 4;    ///< ETags returned by the list accessor
static constexpr size_t CW_HOST_MAX         = 64;   ///< Remote endpoint host text

/// Worst-case encoded size of a message built within the capacities above.
static constexpr size_t CW_DATAGRAM_MAX =
    4 + CW_TOKEN_MAX + CW_OPTIONS_MAX * (1 + 2 + 2 + CW_OPTION_VALUE_MAX) + 1 + CW_PAYLOAD_MAX;

/// IANA-assigned CoAP port.
static constexpr uint16_t COAP_PORT = 5683;

/// Block size exponent this side prefers when renegotiating a block size (64 bytes).
/// The blockwise functions take it as the default for their `preferred_szx` argument.
static constexpr uint8_t DEFAULT_BLOCK_SIZE_EXPONENT = 2;

/**
 * @brief CoAP transmission parameters with their derived values.
 *
 * Base values default to RFC 7252 §4.8. Derived values are computed, never stored, so an
 * override of a base value (e.g. a longer ACK_TIMEOUT for a slow radio) flows through.
 */
struct TransmissionParams {
  double   ack_timeout{2.0};        ///< seconds
  double   ack_random_factor{1.5};
  uint8_t  max_retransmit{4};
  uint8_t  nstart{1};
  double   default_leisure{5.0};    ///< seconds
  double   probing_rate{1.0};       ///< bytes/second
  double   max_latency{100.0};      ///< seconds
  double   empty_ack_delay{0.1};    ///< seconds before a separate response gets an empty ACK
  uint8_t  default_block_size_exponent{DEFAULT_BLOCK_SIZE_EXPONENT};

  double max_transmit_span() const {
    return ack_timeout * static_cast<double>((1u << max_retransmit) - 1u) * ack_random_factor;
  }

  double max_transmit_wait() const {
    return ack_timeout * static_cast<double>((1u << (max_retransmit + 1u)) - 1u) * ack_random_factor;
  }

  double processing_delay() const { return ack_timeout; }
  double max_rtt() const          { return 2.0 * max_latency + processing_delay(); }
  double exchange_lifetime() const { return max_transmit_span() + max_rtt(); }
  double non_lifetime() const     { return max_transmit_span() + max_latency; }

  /// Not an IETF value: how long a server waits for a request to complete before giving up.
  double request_timeout() const  { return max_transmit_wait(); }
};

} // namespace coapwire

#endif // COAPWIRE_CONFIG_HPP
