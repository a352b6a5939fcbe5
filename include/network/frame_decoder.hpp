// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace forkscan {
namespace network {

// Default upper bound on a frame's declared payloadLength (4 MiB)
static constexpr uint32_t DEFAULT_MAX_PAYLOAD_LENGTH = 4 * 1024 * 1024;

// Fatal decode errors. Running out of bytes is not an error: feed() simply
// emits nothing and keeps the partial frame buffered.
enum class DecodeError : uint8_t {
  NONE,
  INVALID_VERSION,          // version byte is not revision 0 / type 0
  RESOURCE_LIMIT_EXCEEDED,  // declared payloadLength above the configured maximum
  MALFORMED                 // header bytes could not be parsed
};

[[nodiscard]] const char *DecodeErrorToString(DecodeError error) noexcept;

/**
 * FrameDecoder - Incremental decoder for the block frame wire format
 *
 * Accepts chunks of any size (one byte, a whole stream, anything in between)
 * and emits every frame whose 45 + payloadLength bytes have all arrived. The
 * emitted sequence is identical however the input is split.
 *
 * Checks run as soon as their bytes are present: the version byte after 1
 * byte, payloadLength after 5. An oversized declared length is rejected
 * before any payload is buffered.
 *
 * After a fatal error the decoder is poisoned: its buffer is released and
 * every later feed() returns false without emitting anything.
 *
 * THREAD SAFETY: None. A decoder belongs to exactly one stream and must be
 * fed by one thread at a time.
 */
class FrameDecoder {
public:
  explicit FrameDecoder(uint32_t max_payload_length = DEFAULT_MAX_PAYLOAD_LENGTH);

  FrameDecoder(const FrameDecoder &) = delete;
  FrameDecoder &operator=(const FrameDecoder &) = delete;

  /**
   * Append a chunk and decode every complete frame into `out` (appended in
   * stream order). Returns false once the decoder is poisoned; frames that
   * completed before the offending bytes are still appended.
   */
  bool feed(std::span<const uint8_t> chunk, std::vector<chain::CBlock> &out);

  // Drop any partially received frame (stream cancelled or ended).
  // Returns the number of bytes discarded.
  size_t discard_partial();

  bool is_poisoned() const { return error_ != DecodeError::NONE; }
  DecodeError error() const { return error_; }
  const std::string &error_message() const { return error_message_; }

  // Bytes received but not yet part of an emitted frame
  size_t buffered_bytes() const { return buffer_.size() - offset_; }

  uint32_t max_payload_length() const { return max_payload_length_; }
  uint64_t frames_decoded() const { return frames_decoded_; }

private:
  // Decode as many frames as the buffer holds. False on fatal error.
  bool decode_available(std::vector<chain::CBlock> &out);

  void poison(DecodeError error, std::string message);

  // Reclaim consumed prefix once it dominates the buffer
  void compact();

  const uint32_t max_payload_length_;

  // Read offset into buffer_ avoids O(n^2) erase-from-front
  std::vector<uint8_t> buffer_;
  size_t offset_{0};

  DecodeError error_{DecodeError::NONE};
  std::string error_message_;
  uint64_t frames_decoded_{0};
};

} // namespace network
} // namespace forkscan
