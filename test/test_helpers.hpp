// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Shared builders for block, frame and chain index tests

#pragma once

#include "chain/block.hpp"
#include "chain/chain_index.hpp"
#include "util/hash.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace forkscan {
namespace test {

// Distinct, never-null identity derived from a small tag
inline uint256 TestHash(uint64_t tag) {
    uint256 h;
    h.data()[0] = 0xAB;
    for (int i = 0; i < 8; ++i) {
        h.data()[31 - i] = static_cast<uint8_t>(tag >> (8 * i));
    }
    return h;
}

inline std::vector<uint8_t> Payload(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline chain::CBlock MakeBlock(const uint256& parent, uint64_t number,
                               const std::string& payload = "") {
    return chain::CBlock(parent, number, Payload(payload));
}

// Concatenated wire frames
inline std::vector<uint8_t> Frames(const std::vector<chain::CBlock>& blocks) {
    std::vector<uint8_t> out;
    for (const auto& block : blocks) {
        auto frame = block.Serialize();
        out.insert(out.end(), frame.begin(), frame.end());
    }
    return out;
}

inline uint256 HashOf(const chain::CBlock& block) {
    auto frame = block.Serialize();
    return util::DoubleSha256(frame);
}

// A linear chain of `length` blocks built on `parent` starting at `first_number`.
// Each payload carries `tag` so that sibling chains hash differently.
inline std::vector<chain::CBlock> MakeChain(const uint256& parent, uint64_t first_number,
                                            size_t length, const std::string& tag) {
    std::vector<chain::CBlock> blocks;
    uint256 prev = parent;
    for (size_t i = 0; i < length; ++i) {
        blocks.push_back(MakeBlock(prev, first_number + i, tag + "-" + std::to_string(i)));
        prev = HashOf(blocks.back());
    }
    return blocks;
}

// Insert an entry and require that it was new
inline void InsertOrThrow(chain::ChainIndex& index, const uint256& hash,
                          const uint256& parent, uint64_t number) {
    if (index.Insert(hash, parent, number) != chain::InsertResult::INSERTED) {
        throw std::runtime_error("test setup: insert failed");
    }
}

} // namespace test
} // namespace forkscan
