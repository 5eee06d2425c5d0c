// -----------------------------------------------------------------------------
// @file field_codec.cpp
// @brief Nibble + extension codec shared by option delta and option length.
//
// Table and limits: see include/coapwire/field_codec.hpp
// -----------------------------------------------------------------------------
#include "coapwire/field_codec.hpp"

namespace coapwire {

Status decode_field(uint8_t nibble, const uint8_t* data, size_t len,
                    uint32_t& value, size_t& consumed) {
  if (nibble < 13) {
    value = nibble;
    consumed = 0;
    return Status::Ok;
  }

  if (nibble == 13) {
    if (len < 1) return Status::MalformedMessage;    // extension byte missing
    value = static_cast<uint32_t>(data[0]) + FIELD_EXT1_BASE;
    consumed = 1;
    return Status::Ok;
  }

  if (nibble == 14) {
    if (len < 2) return Status::MalformedMessage;
    value = ((static_cast<uint32_t>(data[0]) << 8) | data[1]) + FIELD_EXT2_BASE;
    consumed = 2;
    return Status::Ok;
  }

  // 15 belongs to the payload marker; the options decoder intercepts 0xFF before us.
  return Status::MalformedMessage;
}

Status encode_field(uint32_t value, EncodedField& out) {
  out = EncodedField();

  if (value < FIELD_EXT1_BASE) {
    out.nibble = static_cast<uint8_t>(value);
    return Status::Ok;
  }

  if (value < FIELD_EXT2_BASE) {
    out.nibble  = 13;
    out.ext[0]  = static_cast<uint8_t>(value - FIELD_EXT1_BASE);
    out.ext_len = 1;
    return Status::Ok;
  }

  if (value < FIELD_LIMIT) {
    const uint32_t v = value - FIELD_EXT2_BASE;
    out.nibble  = 14;
    out.ext[0]  = static_cast<uint8_t>((v >> 8) & 0xFF);
    out.ext[1]  = static_cast<uint8_t>(v & 0xFF);
    out.ext_len = 2;
    return Status::Ok;
  }

  return Status::ValueOutOfRange;
}

} // namespace coapwire
