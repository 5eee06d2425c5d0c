/**
 * @file blockwise.hpp
 * @brief Blockwise transfer (RFC 7959): split, reassemble, ask for the next block.
 *
 * A body too large for one datagram travels as a series of blocks. Each block carries a
 * block descriptor `(num, more, szx)`; the block size is `2^(szx + 4)` bytes and the
 * block covers payload bytes `[num * size, num * size + size)`.
 *
 * | Direction                   | Option  | Carried on |
 * |-----------------------------|---------|------------|
 * | request body (PUT/POST)     | Block1  | requests   |
 * | response body (GET result)  | Block2  | responses  |
 *
 * ### Reassembly
 * The caller keeps one accumulator `Message` per transfer and hands every incoming block
 * to `append_request_block()` / `append_response_block()`. Each call checks:
 *  - the accumulator is the right kind of message,
 *  - the block starts exactly at the accumulated length (no gaps, no replays),
 *  - (responses) the ETag has not changed since the first block.
 * On any failure the accumulator is left untouched.
 *
 * ### Size renegotiation
 * A peer that answers block 0 with a larger size than we like is told to switch to the
 * preferred exponent (`DEFAULT_BLOCK_SIZE_EXPONENT` unless the caller passes another,
 * e.g. `TransmissionParams::default_block_size_exponent`). Because bytes already received at the large size are
 * kept, the next block number is rescaled: receiving block 0 at szx=6 (1024 bytes) means
 * the next 64-byte block is number 16.
 *
 * @code
 * coapwire::Message block;
 * for (uint32_t n = 0; coapwire::extract_block(big, n, 2, block) == coapwire::Status::Ok; ++n) {
 *   block.set_message_id(next_mid());
 *   send(block);
 * }
 * @endcode
 */
#ifndef COAPWIRE_BLOCKWISE_HPP
#define COAPWIRE_BLOCKWISE_HPP

#include <stdint.h>
#include "config.hpp"
#include "message.hpp"
#include "status.hpp"

namespace coapwire {

/**
 * @brief Copy block @p block_number of @p msg's payload into @p out.
 *
 * @p out is a copy of @p msg with the payload sliced, the message ID cleared and Block1
 * (requests) or Block2 (everything else) set to `(block_number, more, size_exponent)`,
 * where `more` is true when payload remains after this block.
 *
 * @return Ok; NoBlock if the block starts at or past the end of the payload;
 *         ValueOutOfRange for an exponent above 7 or a block number above 2^20 - 1.
 */
Status extract_block(const Message& msg, uint32_t block_number, uint8_t size_exponent, Message& out);

/**
 * @brief Server side: add an incoming request block to @p acc.
 *
 * On success the payload grows, Block1 is replaced by @p next's, the token and message ID
 * follow @p next and the response-type hint is cleared.
 *
 * @return Ok; InvalidOperation if @p acc is not a request or @p next has no Block1;
 *         BlockSequence if the block does not start at the accumulated length;
 *         Overflow if the body outgrows CW_BODY_MAX.
 */
Status append_request_block(Message& acc, const Message& next);

/**
 * @brief Client side: add an incoming response block to @p acc.
 *
 * On success the payload grows, Block2 is replaced by @p next's and the token and message
 * ID follow @p next.
 *
 * @return Ok; InvalidOperation if @p acc is not a response or @p next has no Block2;
 *         BlockSequence on a gap or overlap; ResourceChanged if the ETags differ
 *         (both absent counts as equal); Overflow if the body outgrows CW_BODY_MAX.
 */
Status append_response_block(Message& acc, const Message& next);

/**
 * @brief Client side: build the request for the block after @p response's.
 *
 * Copies @p original, clears payload and message ID, sets Block2 to the next block
 * (renegotiating to @p preferred_szx after an oversized block 0), and removes Block1 and
 * Observe.
 *
 * @return Ok; InvalidOperation if @p response has no Block2;
 *         ValueOutOfRange if @p preferred_szx is above 7.
 */
Status generate_next_block2_request(const Message& original, const Message& response, Message& out,
                                    uint8_t preferred_szx = DEFAULT_BLOCK_SIZE_EXPONENT);

/**
 * @brief Server side: build the 2.04 Changed that asks for the next request block.
 *
 * The answer has @p request's token and remote, and Block1 `(num, true, szx)` echoing the
 * received block, or `(0, true, preferred_szx)` to renegotiate an oversized block 0.
 * Type and message ID stay unset for the transport to fill in.
 *
 * @return Ok; InvalidOperation if @p request has no Block1;
 *         ValueOutOfRange if @p preferred_szx is above 7.
 */
Status generate_next_block1_response(const Message& request, Message& out,
                                     uint8_t preferred_szx = DEFAULT_BLOCK_SIZE_EXPONENT);

} // namespace coapwire

#endif // COAPWIRE_BLOCKWISE_HPP
