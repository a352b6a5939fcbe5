// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_index.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <vector>

namespace forkscan {
namespace chain {

enum class AncestorStatus : uint8_t {
  FOUND,              // ancestor holds the lowest common ancestor
  UNKNOWN_TIP,        // a tip hash is not in the index
  MISSING_ANCESTOR,   // a parent link could not be resolved: not enough history
  NO_COMMON_ANCESTOR, // both walks reached genesis without meeting
  MALFORMED_CHAIN     // non-decreasing parent number or step bound exceeded
};

[[nodiscard]] const char *AncestorStatusToString(AncestorStatus status) noexcept;

struct AncestorResult {
  AncestorStatus status{AncestorStatus::UNKNOWN_TIP};

  // Set when status == FOUND
  uint256 ancestor;

  // The hash that could not be resolved (UNKNOWN_TIP, MISSING_ANCESTOR) or the
  // entry at which the walk was abandoned (MALFORMED_CHAIN)
  uint256 unresolved;

  // Parent hops taken across both walks
  uint64_t steps{0};

  [[nodiscard]] bool Found() const noexcept { return status == AncestorStatus::FOUND; }
};

// Find the lowest common ancestor of two tips by walking parent links in the
// index. Aligns block numbers first, then steps both sides toward genesis
// until the hashes meet. Equal tips, or a tip that is an ancestor of the
// other, resolve to that tip.
//
// Cost is linear in the depth difference plus the shared walk; no unrelated
// branch is visited. Pure read path: safe to run concurrently with inserts.
//
// Walk bound: tip_a.number + tip_b.number + 2 hops. A well-formed chain has
// strictly decreasing numbers toward genesis and can never reach it.
[[nodiscard]] AncestorResult FindCommonAncestor(const ChainIndex &index,
                                                const uint256 &tip_a,
                                                const uint256 &tip_b);

// Lowest common ancestor of every tip in the list (pairwise fold).
// Empty list -> UNKNOWN_TIP. A single known tip resolves to itself.
[[nodiscard]] AncestorResult FindCommonAncestor(const ChainIndex &index,
                                                const std::vector<uint256> &tips);

} // namespace chain
} // namespace forkscan
