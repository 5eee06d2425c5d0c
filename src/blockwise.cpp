// -----------------------------------------------------------------------------
// @file blockwise.cpp
// @brief Block extraction, reassembly and next-block generation.
//
// The append functions validate everything before touching the accumulator, so a
// rejected block never leaves a half-updated message behind.
// -----------------------------------------------------------------------------
#include "coapwire/blockwise.hpp"

namespace coapwire {

namespace {

// Next block descriptor after receiving `got`, renegotiating oversized block 0 to `szx`.
BlockValue next_after(const BlockValue& got, uint8_t szx) {
  if (got.block_number == 0 && got.size_exponent > szx) {
    const uint32_t rescaled = 1u << (got.size_exponent - szx);
    return BlockValue(rescaled, false, szx);
  }
  return BlockValue(got.block_number + 1, false, got.size_exponent);
}

} // namespace

Status extract_block(const Message& msg, uint32_t block_number, uint8_t size_exponent, Message& out) {
  if (size_exponent > BLOCK_EXPONENT_MAX || block_number > BLOCK_NUMBER_MAX) {
    return Status::ValueOutOfRange;
  }

  const size_t len   = msg.payload().size();
  const size_t size  = size_t(1) << (size_exponent + 4);
  const size_t start = static_cast<size_t>(block_number) * size;
  if (start >= len) return Status::NoBlock;

  const size_t end = (start + size < len) ? start + size : len;

  Message block = msg;
  Status st = block.set_payload(msg.payload().data() + start, end - start);
  if (st != Status::Ok) return st;
  block.set_message_id(etl::nullopt);

  const BlockValue desc(block_number, end < len, size_exponent);
  st = msg.is_request() ? block.options().set_block1(desc)
                        : block.options().set_block2(desc);
  if (st != Status::Ok) return st;

  out = block;
  return Status::Ok;
}

Status append_request_block(Message& acc, const Message& next) {
  if (!acc.is_request()) return Status::InvalidOperation;

  const etl::optional<BlockValue> b1 = next.options().block1();
  if (!b1.has_value()) return Status::InvalidOperation;
  if (b1.value().offset() != acc.payload().size()) return Status::BlockSequence;
  if (next.payload().size() > acc.payload().available()) return Status::Overflow;

  Status st = acc.options().set_block1(b1);
  if (st != Status::Ok) return st;
  st = acc.append_payload(next.payload().data(), next.payload().size());
  if (st != Status::Ok) return st;
  acc.set_token(next.token());
  acc.set_message_id(next.message_id());
  acc.set_response_type(etl::nullopt);
  return Status::Ok;
}

Status append_response_block(Message& acc, const Message& next) {
  if (!acc.is_response()) return Status::InvalidOperation;

  const etl::optional<BlockValue> b2 = next.options().block2();
  if (!b2.has_value()) return Status::InvalidOperation;
  if (b2.value().offset() != acc.payload().size()) return Status::BlockSequence;
  if (next.options().etag() != acc.options().etag()) return Status::ResourceChanged;
  if (next.payload().size() > acc.payload().available()) return Status::Overflow;

  Status st = acc.options().set_block2(b2);
  if (st != Status::Ok) return st;
  st = acc.append_payload(next.payload().data(), next.payload().size());
  if (st != Status::Ok) return st;
  acc.set_token(next.token());
  acc.set_message_id(next.message_id());
  return Status::Ok;
}

Status generate_next_block2_request(const Message& original, const Message& response, Message& out,
                                    uint8_t preferred_szx) {
  if (preferred_szx > BLOCK_EXPONENT_MAX) return Status::ValueOutOfRange;
  const etl::optional<BlockValue> got = response.options().block2();
  if (!got.has_value()) return Status::InvalidOperation;

  Message req = original;
  req.clear_payload();
  req.set_message_id(etl::nullopt);

  const Status st = req.options().set_block2(next_after(got.value(), preferred_szx));
  if (st != Status::Ok) return st;
  req.options().remove_option(option::BLOCK1);
  req.options().remove_option(option::OBSERVE);

  out = req;
  return Status::Ok;
}

Status generate_next_block1_response(const Message& request, Message& out, uint8_t preferred_szx) {
  if (preferred_szx > BLOCK_EXPONENT_MAX) return Status::ValueOutOfRange;
  const etl::optional<BlockValue> got = request.options().block1();
  if (!got.has_value()) return Status::InvalidOperation;

  Message resp;
  resp.set_code(code::CHANGED);
  resp.set_token(request.token());
  resp.set_remote(request.remote());

  const BlockValue& g = got.value();
  const BlockValue b1 = (g.block_number == 0 && g.size_exponent > preferred_szx)
                            ? BlockValue(0, true, preferred_szx)
                            : BlockValue(g.block_number, true, g.size_exponent);
  const Status st = resp.options().set_block1(b1);
  if (st != Status::Ok) return st;

  out = resp;
  return Status::Ok;
}

} // namespace coapwire
