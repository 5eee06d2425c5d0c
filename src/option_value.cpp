// -----------------------------------------------------------------------------
// @file option_value.cpp
// @brief Encode/decode for the three CoAP option value formats.
//
// Uint and Block share one rule: the packed integer is written big-endian with
// all leading zero bytes dropped. A zero value therefore has no bytes at all.
// -----------------------------------------------------------------------------
#include "coapwire/option_value.hpp"
#include <string.h>

namespace coapwire {

namespace {

// Write the low `n` bytes of `v` big-endian.
void write_uint_be(uint32_t v, size_t n, uint8_t* out) {
  for (size_t i = 0; i < n; ++i) {
    out[i] = static_cast<uint8_t>((v >> (8 * (n - 1 - i))) & 0xFF);
  }
}

uint32_t read_uint_be(const uint8_t* data, size_t len) {
  uint32_t v = 0;
  for (size_t i = 0; i < len; ++i) v = (v << 8) | data[i];
  return v;
}

} // namespace

size_t uint_length(uint32_t v) {
  if (v == 0)          return 0;
  if (v < 0x100u)      return 1;
  if (v < 0x10000u)    return 2;
  if (v < 0x1000000u)  return 3;
  return 4;
}

// =============================================================================
// Construction
// =============================================================================

Status OptionValue::make_opaque(const uint8_t* data, size_t len, OptionValue& out) {
  if (len > CW_OPTION_VALUE_MAX) return Status::Overflow;
  out = OptionValue(OptionFormat::Opaque);
  if (len > 0) out.bytes_.assign(data, data + len);
  return Status::Ok;
}

Status OptionValue::make_string(const char* s, OptionValue& out) {
  const size_t n = s ? ::strlen(s) : 0;
  return make_opaque(reinterpret_cast<const uint8_t*>(s), n, out);
}

OptionValue OptionValue::make_uint(uint32_t v) {
  OptionValue out(OptionFormat::Uint);
  out.uint_ = v;
  return out;
}

Status OptionValue::make_block(const BlockValue& b, OptionValue& out) {
  if (b.block_number > BLOCK_NUMBER_MAX || b.size_exponent > BLOCK_EXPONENT_MAX) {
    return Status::ValueOutOfRange;
  }
  out = OptionValue(OptionFormat::Block);
  out.block_ = b;
  return Status::Ok;
}

// =============================================================================
// Codec
// =============================================================================

size_t OptionValue::length() const {
  switch (format_) {
    case OptionFormat::Uint:  return uint_length(uint_);
    case OptionFormat::Block: return uint_length(block_.pack());
    case OptionFormat::Opaque:
    default:                  return bytes_.size();
  }
}

void OptionValue::encode(uint8_t* out) const {
  switch (format_) {
    case OptionFormat::Uint:
      write_uint_be(uint_, uint_length(uint_), out);
      break;
    case OptionFormat::Block: {
      const uint32_t packed = block_.pack();
      write_uint_be(packed, uint_length(packed), out);
      break;
    }
    case OptionFormat::Opaque:
    default:
      if (!bytes_.empty()) ::memcpy(out, bytes_.data(), bytes_.size());
      break;
  }
}

Status OptionValue::decode(const uint8_t* data, size_t len) {
  switch (format_) {
    case OptionFormat::Uint:
      if (len > 4) return Status::MalformedMessage;      // wider than we can hold
      uint_ = read_uint_be(data, len);                     // no bytes -> 0
      return Status::Ok;

    case OptionFormat::Block:
      if (len > 3) return Status::MalformedMessage;      // RFC 7959: 0..3 bytes
      block_ = BlockValue::unpack(read_uint_be(data, len));
      return Status::Ok;

    case OptionFormat::Opaque:
    default:
      if (len > CW_OPTION_VALUE_MAX) return Status::Overflow;
      bytes_.clear();
      if (len > 0) bytes_.assign(data, data + len);
      return Status::Ok;
  }
}

bool OptionValue::operator==(const OptionValue& o) const {
  if (format_ != o.format_) return false;
  switch (format_) {
    case OptionFormat::Uint:  return uint_ == o.uint_;
    case OptionFormat::Block: return block_ == o.block_;
    case OptionFormat::Opaque:
    default:                  return bytes_ == o.bytes_;
  }
}

} // namespace coapwire
