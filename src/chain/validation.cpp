// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "util/logging.hpp"
#include <string>

namespace forkscan {
namespace validation {

bool CheckBlock(const chain::CBlock &block, ValidationState &state) {
  const auto &header = block.header;

  if (!header.version.IsSupported()) {
    LOG_CHAIN_DEBUG("CheckBlock: unsupported version revision={} type={}",
                    header.version.revision, header.version.message_type);
    return state.Invalid("bad-version",
                         "revision " + std::to_string(header.version.revision) +
                             ", message type " +
                             std::to_string(header.version.message_type));
  }

  if (static_cast<size_t>(header.nPayloadLength) != block.payload.size()) {
    LOG_CHAIN_DEBUG("CheckBlock: payload length mismatch declared={} actual={}",
                    header.nPayloadLength, block.payload.size());
    return state.Invalid("bad-payload-length",
                         "declared " + std::to_string(header.nPayloadLength) +
                             ", carried " + std::to_string(block.payload.size()));
  }

  return true;
}

} // namespace validation
} // namespace forkscan
