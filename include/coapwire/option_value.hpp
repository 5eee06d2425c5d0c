/**
 * @file option_value.hpp
 * @brief Typed CoAP option values: opaque/string, unsigned integer, block descriptor.
 *
 * An `OptionValue` is a closed tagged variant. The format is picked from the option
 * number registry when a message is decoded (see options.hpp). Every format knows its
 * wire length and can write and read itself.
 *
 * | Format | Wire form                                             | Length         |
 * |--------|-------------------------------------------------------|----------------|
 * | Opaque | raw bytes                                             | byte count     |
 * | Uint   | minimal big-endian, no leading zeros, 0 -> no bytes   | 0..4           |
 * | Block  | `num << 4 \| more << 3 \| szx`, then encoded as Uint  | 0..3           |
 *
 * ### Block descriptor (RFC 7959 §2.2)
 * ```
 *  NUM (variable, up to 20 bits) | M (1 bit) | SZX (3 bits)
 * ```
 * Block size is `2^(SZX + 4)`: 16, 32, 64 ... 2048 bytes.
 *
 * Examples:
 * - Uint 0     -> `[]`
 * - Uint 255   -> `[0xFF]`
 * - Uint 256   -> `[0x01, 0x00]`
 * - Block (2, more, szx=2) -> 0x2A -> `[0x2A]`
 */
#ifndef COAPWIRE_OPTION_VALUE_HPP
#define COAPWIRE_OPTION_VALUE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/vector.h"
#include "config.hpp"
#include "status.hpp"

namespace coapwire {

enum class OptionFormat : uint8_t {
  Opaque = 0,
  Uint,
  Block,
};

/// Raw bytes of an opaque/string option value.
using OpaqueBytes = etl::vector<uint8_t, CW_OPTION_VALUE_MAX>;

static constexpr uint32_t BLOCK_NUMBER_MAX   = 0xFFFFF;  ///< 20-bit NUM field
static constexpr uint8_t  BLOCK_EXPONENT_MAX = 7;

/// The (block_number, more, size_exponent) triple carried by Block1 and Block2.
struct BlockValue {
  uint32_t block_number{0};
  bool     more{false};
  uint8_t  size_exponent{0};

  BlockValue() = default;
  BlockValue(uint32_t num, bool m, uint8_t szx)
  : block_number(num), more(m), size_exponent(szx) {}

  /// Block size in bytes for this exponent.
  size_t block_size() const { return size_t(1) << (size_exponent + 4); }

  /// Byte offset of this block inside the full body.
  size_t offset() const { return static_cast<size_t>(block_number) * block_size(); }

  uint32_t pack() const {
    return (block_number << 4) | (more ? 0x08u : 0u) | (size_exponent & 0x07u);
  }

  static BlockValue unpack(uint32_t v) {
    return BlockValue(v >> 4, (v & 0x08u) != 0, static_cast<uint8_t>(v & 0x07u));
  }

  bool operator==(const BlockValue& o) const {
    return block_number == o.block_number && more == o.more && size_exponent == o.size_exponent;
  }
  bool operator!=(const BlockValue& o) const { return !(*this == o); }
};

/// Canonical byte count of an unsigned value: 0 -> 0, 1..255 -> 1, ... up to 4.
size_t uint_length(uint32_t v);

class OptionValue {
public:
  /// Empty opaque value.
  OptionValue() : format_(OptionFormat::Opaque), uint_(0) {}

  /// Empty value of the given format (Uint 0, Block (0,false,0), or no bytes).
  explicit OptionValue(OptionFormat f) : format_(f), uint_(0) {}

  // -------- Construction helpers (fail instead of truncating) --------

  static Status make_opaque(const uint8_t* data, size_t len, OptionValue& out);
  static Status make_string(const char* s, OptionValue& out);
  static OptionValue make_uint(uint32_t v);
  static Status make_block(const BlockValue& b, OptionValue& out);

  // -------- Inspection --------

  OptionFormat format() const { return format_; }

  /// Only meaningful for Opaque values.
  const OpaqueBytes& bytes() const { return bytes_; }

  /// Only meaningful for Uint values.
  uint32_t as_uint() const { return uint_; }

  /// Only meaningful for Block values.
  const BlockValue& as_block() const { return block_; }

  // -------- Codec --------

  /// Encoded length in bytes (canonical for Uint and Block).
  size_t length() const;

  /// Write exactly length() bytes to @p out. Caller guarantees the space.
  void encode(uint8_t* out) const;

  /**
   * @brief Replace the value by decoding @p len bytes in this value's format.
   * @return Ok; Overflow for opaque data past CW_OPTION_VALUE_MAX;
   *         MalformedMessage for a Uint wider than 4 bytes or a Block wider than 3.
   */
  Status decode(const uint8_t* data, size_t len);

  bool operator==(const OptionValue& o) const;
  bool operator!=(const OptionValue& o) const { return !(*this == o); }

private:
  OptionFormat format_;
  uint32_t     uint_;
  BlockValue   block_;
  OpaqueBytes  bytes_;
};

} // namespace coapwire

#endif // COAPWIRE_OPTION_VALUE_HPP
