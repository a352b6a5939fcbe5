// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/frame_decoder.hpp"
#include "chain/endian.hpp"
#include "util/logging.hpp"
#include <string>

namespace forkscan {
namespace network {

using chain::CBlock;
using chain::CBlockHeader;
using chain::VersionByte;

const char *DecodeErrorToString(DecodeError error) noexcept {
  switch (error) {
    case DecodeError::NONE: return "none";
    case DecodeError::INVALID_VERSION: return "invalid-version";
    case DecodeError::RESOURCE_LIMIT_EXCEEDED: return "resource-limit-exceeded";
    case DecodeError::MALFORMED: return "malformed";
  }
  return "unknown";
}

FrameDecoder::FrameDecoder(uint32_t max_payload_length)
    : max_payload_length_(max_payload_length) {}

bool FrameDecoder::feed(std::span<const uint8_t> chunk, std::vector<CBlock> &out) {
  if (is_poisoned()) {
    return false;
  }

  compact();

  buffer_.reserve(buffer_.size() + chunk.size());
  buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());

  LOG_NET_TRACE("FrameDecoder buffer now {} bytes (offset={}, usable={})",
                buffer_.size(), offset_, buffered_bytes());

  return decode_available(out);
}

bool FrameDecoder::decode_available(std::vector<CBlock> &out) {
  while (buffered_bytes() > 0) {
    const uint8_t *read_ptr = buffer_.data() + offset_;
    const size_t available = buffered_bytes();

    // Version is judged as soon as its byte arrives
    VersionByte version = VersionByte::Decode(read_ptr[CBlockHeader::OFF_VERSION]);
    if (!version.IsSupported()) {
      poison(DecodeError::INVALID_VERSION,
             "unsupported version (revision " + std::to_string(version.revision) +
                 ", message type " + std::to_string(version.message_type) + ")");
      return false;
    }

    if (available < CBlockHeader::OFF_PARENT) {
      return true; // wait for payloadLength
    }

    // Length is judged before anything beyond the header is awaited
    const uint32_t payload_length = endian::ReadBE32(read_ptr + CBlockHeader::OFF_LENGTH);
    if (payload_length > max_payload_length_) {
      poison(DecodeError::RESOURCE_LIMIT_EXCEEDED,
             "declared payload length " + std::to_string(payload_length) +
                 " exceeds maximum " + std::to_string(max_payload_length_));
      return false;
    }

    const size_t frame_size = CBlockHeader::HEADER_SIZE + payload_length;
    if (available < frame_size) {
      return true; // wait for the rest of the frame
    }

    CBlock block;
    if (!block.header.Deserialize(read_ptr, CBlockHeader::HEADER_SIZE)) {
      poison(DecodeError::MALFORMED, "header deserialization failed");
      return false;
    }

    const uint8_t *payload_ptr = read_ptr + CBlockHeader::HEADER_SIZE;
    block.payload.assign(payload_ptr, payload_ptr + payload_length);

    offset_ += frame_size;
    ++frames_decoded_;

    LOG_NET_TRACE("Decoded frame number={} payload={} bytes",
                  block.header.nBlockNumber, payload_length);
    out.push_back(std::move(block));
  }
  return true;
}

size_t FrameDecoder::discard_partial() {
  const size_t discarded = buffered_bytes();
  buffer_.clear();
  buffer_.shrink_to_fit();
  offset_ = 0;
  return discarded;
}

void FrameDecoder::poison(DecodeError error, std::string message) {
  LOG_NET_DEBUG("FrameDecoder poisoned: {} ({})", DecodeErrorToString(error), message);
  error_ = error;
  error_message_ = std::move(message);
  discard_partial();
}

void FrameDecoder::compact() {
  if (offset_ == 0) {
    return;
  }

  if (offset_ >= buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  } else if (offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }

  // Release capacity left behind by a large frame
  if (buffer_.size() < 1024 && buffer_.capacity() > 64 * 1024) {
    buffer_.shrink_to_fit();
  }
}

} // namespace network
} // namespace forkscan
