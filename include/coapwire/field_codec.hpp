/**
 * @file field_codec.hpp
 * @brief Option delta / option length field codec (4-bit nibble + extension bytes).
 *
 * Every CoAP option starts with one byte holding two 4-bit nibbles: the option delta
 * (upper) and the value length (lower). Values that do not fit in a nibble spill into
 * extension bytes that follow the header byte, delta extension first:
 *
 * | Nibble | Meaning                                 | Extension bytes |
 * |--------|-----------------------------------------|-----------------|
 * | 0..12  | value = nibble                          | 0               |
 * | 13     | value = ext[0] + 13                     | 1               |
 * | 14     | value = (ext[0] << 8 \| ext[1]) + 269   | 2 (big-endian)  |
 * | 15     | reserved: 0xFF is the payload marker   | none            |
 *
 * The largest representable value is 65535 + 269 = 65803.
 *
 * ### Example
 * A delta of 300 is written as nibble 14 followed by `[0x00, 0x1F]` (300 - 269 = 31).
 */
#ifndef COAPWIRE_FIELD_CODEC_HPP
#define COAPWIRE_FIELD_CODEC_HPP

#include <stdint.h>
#include <stddef.h>
#include "status.hpp"

namespace coapwire {

static constexpr uint32_t FIELD_EXT1_BASE = 13;     ///< first value needing one extension byte
static constexpr uint32_t FIELD_EXT2_BASE = 269;    ///< first value needing two extension bytes
static constexpr uint32_t FIELD_LIMIT     = 65804;  ///< first value that cannot be encoded

/// An encoded field: the nibble plus up to two extension bytes.
struct EncodedField {
  uint8_t nibble{0};
  uint8_t ext[2]{0, 0};
  uint8_t ext_len{0};
};

/**
 * @brief Decode one delta or length field.
 * @param nibble   The 4-bit value taken from the option header byte.
 * @param data     Bytes following the header byte (extension bytes are read from here).
 * @param len      Number of bytes available at @p data.
 * @param value    Decoded value on success.
 * @param consumed Extension bytes consumed on success (0, 1 or 2).
 * @return Ok, or MalformedMessage if the extension is truncated or the nibble is 15.
 */
Status decode_field(uint8_t nibble, const uint8_t* data, size_t len,
                    uint32_t& value, size_t& consumed);

/**
 * @brief Encode one delta or length field.
 * @return Ok, or ValueOutOfRange for values >= 65804.
 */
Status encode_field(uint32_t value, EncodedField& out);

} // namespace coapwire

#endif // COAPWIRE_FIELD_CODEC_HPP
