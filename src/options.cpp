// -----------------------------------------------------------------------------
// @file options.cpp
// @brief Options container: registry, delta encode/decode, typed accessors.
//
// API contract and wire diagram: see include/coapwire/options.hpp
//
// Guard rails kept here:
// - append() is the single insertion path and keeps entries_ sorted by number.
// - Setters check capacity before clearing, so a failed set leaves the old values.
// -----------------------------------------------------------------------------
#include "coapwire/options.hpp"
#include "coapwire/field_codec.hpp"
#include <string.h>

namespace coapwire {

// =============================================================================
// Registry
// =============================================================================

OptionFormat Options::format_for(uint32_t number) {
  switch (number) {
    case option::OBSERVE:
    case option::URI_PORT:
    case option::CONTENT_FORMAT:
    case option::MAX_AGE:
    case option::ACCEPT:
    case option::SIZE2:
      return OptionFormat::Uint;
    case option::BLOCK1:
    case option::BLOCK2:
      return OptionFormat::Block;
    default:
      return OptionFormat::Opaque;
  }
}

bool Options::has_typed_accessor(uint32_t number) {
  switch (number) {
    case option::URI_HOST:
    case option::ETAG:
    case option::OBSERVE:
    case option::URI_PORT:
    case option::LOCATION_PATH:
    case option::URI_PATH:
    case option::CONTENT_FORMAT:
    case option::MAX_AGE:
    case option::URI_QUERY:
    case option::ACCEPT:
    case option::BLOCK2:
    case option::BLOCK1:
    case option::SIZE2:
      return true;
    default:
      return false;
  }
}

// =============================================================================
// Codec
// =============================================================================

Status Options::encode(uint8_t* out, size_t cap, size_t& out_len) const {
  size_t   pos     = 0;
  uint32_t running = 0;   // number of the previously emitted option

  for (const auto& e : entries_) {
    EncodedField delta;
    EncodedField length;
    const size_t vlen = e.value.length();

    Status st = encode_field(e.number - running, delta);
    if (st != Status::Ok) return st;
    st = encode_field(static_cast<uint32_t>(vlen), length);
    if (st != Status::Ok) return st;

    const size_t need = 1 + delta.ext_len + length.ext_len + vlen;
    if (need > cap - pos) return Status::Overflow;

    // header byte: delta nibble high, length nibble low
    out[pos++] = static_cast<uint8_t>((delta.nibble << 4) | length.nibble);
    for (uint8_t i = 0; i < delta.ext_len; ++i)  out[pos++] = delta.ext[i];
    for (uint8_t i = 0; i < length.ext_len; ++i) out[pos++] = length.ext[i];

    e.value.encode(out + pos);
    pos += vlen;
    running = e.number;
  }

  out_len = pos;
  return Status::Ok;
}

Status Options::decode(const uint8_t* data, size_t len, size_t& payload_offset) {
  entries_.clear();

  size_t   pos    = 0;
  uint32_t number = 0;    // running option number

  while (pos < len) {
    // payload marker ends the option list
    if (data[pos] == 0xFF) {
      payload_offset = pos + 1;
      return Status::Ok;
    }

    const uint8_t header = data[pos++];
    uint32_t delta  = 0;
    uint32_t length = 0;
    size_t   used   = 0;

    Status st = decode_field(static_cast<uint8_t>(header >> 4), data + pos, len - pos, delta, used);
    if (st != Status::Ok) return st;
    pos += used;

    st = decode_field(static_cast<uint8_t>(header & 0x0F), data + pos, len - pos, length, used);
    if (st != Status::Ok) return st;
    pos += used;

    if (length > len - pos) return Status::MalformedMessage;   // value runs past the datagram

    number += delta;
    OptionValue value(format_for(number));
    st = value.decode(data + pos, length);
    if (st != Status::Ok) return st;

    st = append(number, value);
    if (st != Status::Ok) return st;
    pos += length;
  }

  // ran out of bytes without a marker: no payload
  payload_offset = len;
  return Status::Ok;
}

// =============================================================================
// Generic access
// =============================================================================

size_t Options::count(uint32_t number) const {
  size_t n = 0;
  for (const auto& e : entries_) if (e.number == number) ++n;
  return n;
}

const OptionValue* Options::get(uint32_t number, size_t index) const {
  for (const auto& e : entries_) {
    if (e.number != number) continue;
    if (index == 0) return &e.value;
    --index;
  }
  return nullptr;
}

Status Options::add_option(uint32_t number, const OptionValue& value) {
  if (has_typed_accessor(number)) return Status::InvalidOperation;
  if (value.format() != format_for(number)) return Status::InvalidOperation;
  return append(number, value);
}

void Options::remove_option(uint32_t number) {
  size_t i = 0;
  while (i < entries_.size()) {
    if (entries_[i].number == number) entries_.erase(entries_.begin() + i);
    else ++i;
  }
}

Status Options::append(uint32_t number, const OptionValue& value) {
  if (entries_.full()) return Status::Overflow;

  // insert after the last entry whose number is <= ours
  size_t at = entries_.size();
  while (at > 0 && entries_[at - 1].number > number) --at;

  OptionEntry e;
  e.number = number;
  e.value  = value;
  entries_.insert(entries_.begin() + at, e);
  return Status::Ok;
}

bool Options::operator==(const Options& o) const {
  if (entries_.size() != o.entries_.size()) return false;
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i] != o.entries_[i]) return false;
  }
  return true;
}

// =============================================================================
// Typed helpers
// =============================================================================

Status Options::set_single(uint32_t number, const OptionValue* value) {
  if (value && entries_.available() + count(number) < 1) return Status::Overflow;
  remove_option(number);
  if (!value) return Status::Ok;    // absent value: clear only
  return append(number, *value);
}

Status Options::set_uint(uint32_t number, const etl::optional<uint32_t>& v) {
  if (!v.has_value()) return set_single(number, nullptr);
  const OptionValue value = OptionValue::make_uint(v.value());
  return set_single(number, &value);
}

etl::optional<uint32_t> Options::get_uint(uint32_t number) const {
  const OptionValue* v = get(number);
  if (!v) return etl::optional<uint32_t>();
  return etl::optional<uint32_t>(v->as_uint());
}

Status Options::set_block(uint32_t number, const etl::optional<BlockValue>& b) {
  if (!b.has_value()) return set_single(number, nullptr);
  OptionValue value;
  const Status st = OptionValue::make_block(b.value(), value);
  if (st != Status::Ok) return st;
  return set_single(number, &value);
}

etl::optional<BlockValue> Options::get_block(uint32_t number) const {
  const OptionValue* v = get(number);
  if (!v) return etl::optional<BlockValue>();
  return etl::optional<BlockValue>(v->as_block());
}

Status Options::set_segments(uint32_t number, const SegmentList& segments) {
  if (entries_.available() + count(number) < segments.size()) return Status::Overflow;
  remove_option(number);
  for (const auto& s : segments) {
    OptionValue value;
    Status st = OptionValue::make_opaque(reinterpret_cast<const uint8_t*>(s.data()), s.size(), value);
    if (st != Status::Ok) return st;
    st = append(number, value);
    if (st != Status::Ok) return st;
  }
  return Status::Ok;
}

Status Options::set_segments(uint32_t number, const char* const* segments, size_t n) {
  if (n > CW_SEGMENTS_MAX) return Status::Overflow;
  if (entries_.available() + count(number) < n) return Status::Overflow;
  for (size_t i = 0; i < n; ++i) {
    if (!segments[i] || ::strlen(segments[i]) > CW_SEGMENT_MAX) return Status::Overflow;
  }
  remove_option(number);
  for (size_t i = 0; i < n; ++i) {
    OptionValue value;
    Status st = OptionValue::make_string(segments[i], value);
    if (st != Status::Ok) return st;
    st = append(number, value);
    if (st != Status::Ok) return st;
  }
  return Status::Ok;
}

Status Options::get_segments(uint32_t number, SegmentList& out) const {
  out.clear();
  for (const auto& e : entries_) {
    if (e.number != number) continue;
    const OpaqueBytes& b = e.value.bytes();
    if (out.full() || b.size() > CW_SEGMENT_MAX) return Status::Overflow;
    Segment s;
    s.assign(reinterpret_cast<const char*>(b.data()), b.size());
    out.push_back(s);
  }
  return Status::Ok;
}

// =============================================================================
// Typed accessors
// =============================================================================

Status Options::set_uri_path(const SegmentList& segments) { return set_segments(option::URI_PATH, segments); }
Status Options::set_uri_path(const char* const* segments, size_t n) { return set_segments(option::URI_PATH, segments, n); }
Status Options::uri_path(SegmentList& out) const { return get_segments(option::URI_PATH, out); }

Status Options::set_uri_query(const SegmentList& segments) { return set_segments(option::URI_QUERY, segments); }
Status Options::set_uri_query(const char* const* segments, size_t n) { return set_segments(option::URI_QUERY, segments, n); }
Status Options::uri_query(SegmentList& out) const { return get_segments(option::URI_QUERY, out); }

Status Options::set_location_path(const SegmentList& segments) { return set_segments(option::LOCATION_PATH, segments); }
Status Options::location_path(SegmentList& out) const { return get_segments(option::LOCATION_PATH, out); }

Status Options::set_block1(const etl::optional<BlockValue>& b) { return set_block(option::BLOCK1, b); }
etl::optional<BlockValue> Options::block1() const { return get_block(option::BLOCK1); }

Status Options::set_block2(const etl::optional<BlockValue>& b) { return set_block(option::BLOCK2, b); }
etl::optional<BlockValue> Options::block2() const { return get_block(option::BLOCK2); }

Status Options::set_content_format(const etl::optional<uint32_t>& v) { return set_uint(option::CONTENT_FORMAT, v); }
etl::optional<uint32_t> Options::content_format() const { return get_uint(option::CONTENT_FORMAT); }

Status Options::set_observe(const etl::optional<uint32_t>& v) { return set_uint(option::OBSERVE, v); }
etl::optional<uint32_t> Options::observe() const { return get_uint(option::OBSERVE); }

Status Options::set_accept(const etl::optional<uint32_t>& v) { return set_uint(option::ACCEPT, v); }
etl::optional<uint32_t> Options::accept() const { return get_uint(option::ACCEPT); }

Status Options::set_uri_port(const etl::optional<uint32_t>& v) { return set_uint(option::URI_PORT, v); }
etl::optional<uint32_t> Options::uri_port() const { return get_uint(option::URI_PORT); }

Status Options::set_max_age(const etl::optional<uint32_t>& v) { return set_uint(option::MAX_AGE, v); }
etl::optional<uint32_t> Options::max_age() const { return get_uint(option::MAX_AGE); }

Status Options::set_size2(const etl::optional<uint32_t>& v) { return set_uint(option::SIZE2, v); }
etl::optional<uint32_t> Options::size2() const { return get_uint(option::SIZE2); }

Status Options::set_uri_host(const char* host) {
  if (!host) return set_single(option::URI_HOST, nullptr);
  if (::strlen(host) > CW_SEGMENT_MAX) return Status::Overflow;
  OptionValue value;
  const Status st = OptionValue::make_string(host, value);
  if (st != Status::Ok) return st;
  return set_single(option::URI_HOST, &value);
}

etl::optional<Segment> Options::uri_host() const {
  const OptionValue* v = get(option::URI_HOST);
  if (!v || v->bytes().size() > CW_SEGMENT_MAX) return etl::optional<Segment>();
  Segment s;
  s.assign(reinterpret_cast<const char*>(v->bytes().data()), v->bytes().size());
  return etl::optional<Segment>(s);
}

Status Options::set_etag(const etl::optional<OpaqueBytes>& tag) {
  if (!tag.has_value()) return set_single(option::ETAG, nullptr);
  OptionValue value;
  const Status st = OptionValue::make_opaque(tag.value().data(), tag.value().size(), value);
  if (st != Status::Ok) return st;
  return set_single(option::ETAG, &value);
}

etl::optional<OpaqueBytes> Options::etag() const {
  const OptionValue* v = get(option::ETAG);
  if (!v) return etl::optional<OpaqueBytes>();
  return etl::optional<OpaqueBytes>(v->bytes());
}

Status Options::set_etags(const ETagList& tags) {
  if (entries_.available() + count(option::ETAG) < tags.size()) return Status::Overflow;
  remove_option(option::ETAG);
  for (const auto& t : tags) {
    OptionValue value;
    Status st = OptionValue::make_opaque(t.data(), t.size(), value);
    if (st != Status::Ok) return st;
    st = append(option::ETAG, value);
    if (st != Status::Ok) return st;
  }
  return Status::Ok;
}

Status Options::etags(ETagList& out) const {
  out.clear();
  for (const auto& e : entries_) {
    if (e.number != option::ETAG) continue;
    if (out.full()) return Status::Overflow;
    out.push_back(e.value.bytes());
  }
  return Status::Ok;
}

} // namespace coapwire
