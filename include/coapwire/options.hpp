/**
 * @file options.hpp
 * @brief CoAP options container: ordered multi-map from option number to values.
 *
 * `Options` stores every option instance of a message as an (number, value) entry in a
 * fixed-capacity ETL vector. Entries are kept sorted by option number at insertion time,
 * and entries with the same number keep the order they were added in. That gives the
 * one invariant the wire format depends on:
 *
 *   **encode() visits options in ascending number order, so every delta is >= 0.**
 *
 * It does not depend on callers adding options in order.
 *
 * ## Wire form of one option
 * ```
 *   +---------------+---------------+
 *   | delta nibble  | length nibble |   1 byte
 *   +---------------+---------------+
 *   | delta extension (0-2 bytes)   |
 *   | length extension (0-2 bytes)  |
 *   | value (length bytes)          |
 * ```
 * A byte of 0xFF where a header byte is expected is the payload marker and ends the
 * option list. See field_codec.hpp for the nibble/extension table.
 *
 * ## Formats by option number
 * | Format | Options                                                          |
 * |--------|------------------------------------------------------------------|
 * | Uint   | Observe, Uri-Port, Content-Format, Max-Age, Accept, Size2        |
 * | Block  | Block1, Block2                                                   |
 * | Opaque | everything else (If-Match, Uri-Host, ETag, Uri-Path, Size1, ...) |
 *
 * ## Typed accessors
 * Well-known options have getter/setter pairs. A setter always clears every value stored
 * under its number before writing, and a single-valued setter given an absent value
 * (`etl::nullopt`) only clears. Getters return the first stored value, or absent.
 * Options without a typed accessor go through `add_option()` / `remove_option()`;
 * `add_option()` refuses numbers that do have one, so the clear-before-write rule of
 * the typed setters cannot be bypassed.
 *
 * @code
 * coapwire::Options opts;
 * const char* path[] = {"sensors", "temp"};
 * opts.set_uri_path(path, 2);
 * opts.set_content_format(etl::optional<uint32_t>(coapwire::media_type::JSON));
 * opts.set_block2(coapwire::BlockValue(0, false, 2));
 * @endcode
 */
#ifndef COAPWIRE_OPTIONS_HPP
#define COAPWIRE_OPTIONS_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/optional.h"
#include "etl/string.h"
#include "etl/vector.h"
#include "codes.hpp"
#include "config.hpp"
#include "option_value.hpp"
#include "status.hpp"

namespace coapwire {

/// One option instance.
struct OptionEntry {
  uint32_t    number{0};
  OptionValue value;

  bool operator==(const OptionEntry& o) const { return number == o.number && value == o.value; }
  bool operator!=(const OptionEntry& o) const { return !(*this == o); }
};

using Segment     = etl::string<CW_SEGMENT_MAX>;
using SegmentList = etl::vector<Segment, CW_SEGMENTS_MAX>;
using ETagList    = etl::vector<OpaqueBytes, CW_ETAGS_MAX>;

class Options {
public:
  Options() = default;

  // -------- Registry --------

  /// Value format registered for an option number (Opaque when unregistered).
  static OptionFormat format_for(uint32_t number);

  /// True if the number is managed by a typed accessor below.
  static bool has_typed_accessor(uint32_t number);

  // -------- Codec --------

  /**
   * @brief Serialize all options (no payload marker).
   * @param out     Destination buffer.
   * @param cap     Capacity of @p out.
   * @param out_len Bytes written on success.
   * @return Ok, Overflow if @p cap is too small, ValueOutOfRange for an unencodable delta.
   */
  Status encode(uint8_t* out, size_t cap, size_t& out_len) const;

  /**
   * @brief Replace the contents by decoding an option list.
   * @param data           Bytes following the token.
   * @param len            Number of bytes at @p data.
   * @param payload_offset Offset of the first payload byte (== len when there is none).
   * @return Ok, MalformedMessage, or Overflow when a capacity is exceeded.
   */
  Status decode(const uint8_t* data, size_t len, size_t& payload_offset);

  // -------- Generic read access (wire order) --------

  size_t size() const  { return entries_.size(); }
  bool   empty() const { return entries_.empty(); }
  const OptionEntry& operator[](size_t i) const { return entries_[i]; }

  size_t count(uint32_t number) const;
  bool   has(uint32_t number) const { return count(number) > 0; }

  /// The @p index-th value stored under @p number, or nullptr.
  const OptionValue* get(uint32_t number, size_t index = 0) const;

  // -------- Generic mutation (options without a typed accessor) --------

  /**
   * @brief Append a value under @p number, after any values already stored there.
   * @return Ok; InvalidOperation if @p number has a typed accessor or the value's format
   *         does not match the registry; Overflow if the container is full.
   */
  Status add_option(uint32_t number, const OptionValue& value);

  /// Remove every value stored under @p number.
  void remove_option(uint32_t number);

  void clear() { entries_.clear(); }

  // -------- Typed accessors: segment lists --------
  // Segments are at most CW_SEGMENT_MAX bytes; longer ones are Overflow both ways.

  Status set_uri_path(const SegmentList& segments);
  Status set_uri_path(const char* const* segments, size_t count);
  Status set_uri_path(const char* whole_path) = delete;   // pass segments, not one string
  Status uri_path(SegmentList& out) const;

  Status set_uri_query(const SegmentList& segments);
  Status set_uri_query(const char* const* segments, size_t count);
  Status set_uri_query(const char* whole_query) = delete;
  Status uri_query(SegmentList& out) const;

  Status set_location_path(const SegmentList& segments);
  Status location_path(SegmentList& out) const;

  // -------- Typed accessors: single values --------

  Status set_block1(const etl::optional<BlockValue>& b);
  etl::optional<BlockValue> block1() const;

  Status set_block2(const etl::optional<BlockValue>& b);
  etl::optional<BlockValue> block2() const;

  Status set_content_format(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> content_format() const;

  Status set_observe(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> observe() const;

  Status set_accept(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> accept() const;

  Status set_uri_port(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> uri_port() const;

  Status set_max_age(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> max_age() const;

  Status set_size2(const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> size2() const;

  /// nullptr clears. The getter is empty for a decoded host past CW_SEGMENT_MAX.
  Status set_uri_host(const char* host);
  etl::optional<Segment> uri_host() const;

  // -------- ETag: one tag (responses) or a list (requests), same option number --------

  Status set_etag(const etl::optional<OpaqueBytes>& tag);
  etl::optional<OpaqueBytes> etag() const;

  Status set_etags(const ETagList& tags);
  Status etags(ETagList& out) const;

  bool operator==(const Options& o) const;
  bool operator!=(const Options& o) const { return !(*this == o); }

private:
  /// Sorted insertion; the only way entries get in.
  Status append(uint32_t number, const OptionValue& value);

  Status set_single(uint32_t number, const OptionValue* value);
  Status set_uint(uint32_t number, const etl::optional<uint32_t>& v);
  etl::optional<uint32_t> get_uint(uint32_t number) const;
  Status set_block(uint32_t number, const etl::optional<BlockValue>& b);
  etl::optional<BlockValue> get_block(uint32_t number) const;
  Status set_segments(uint32_t number, const SegmentList& segments);
  Status set_segments(uint32_t number, const char* const* segments, size_t count);
  Status get_segments(uint32_t number, SegmentList& out) const;

  etl::vector<OptionEntry, CW_OPTIONS_MAX> entries_;
};

} // namespace coapwire

#endif // COAPWIRE_OPTIONS_HPP
