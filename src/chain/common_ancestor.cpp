// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/common_ancestor.hpp"
#include "util/logging.hpp"
#include <limits>
#include <optional>

namespace forkscan {
namespace chain {

namespace {

uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
  if (a > std::numeric_limits<uint64_t>::max() - b)
    return std::numeric_limits<uint64_t>::max();
  return a + b;
}

AncestorResult MakeResult(AncestorStatus status, const uint256 &hash, uint64_t steps) {
  AncestorResult result;
  result.status = status;
  if (status == AncestorStatus::FOUND) {
    result.ancestor = hash;
  } else {
    result.unresolved = hash;
  }
  result.steps = steps;
  return result;
}

// One side of the walk
class Walker {
public:
  explicit Walker(const ChainEntry &tip) : current_(tip) {}

  const ChainEntry &current() const { return current_; }
  bool at_root() const { return current_.IsGenesis(); }

  // Move to the parent. Returns a failure status, or std::nullopt on success.
  std::optional<AncestorStatus> step(const ChainIndex &index) {
    auto parent = index.Lookup(current_.parent_hash);
    if (!parent) {
      return AncestorStatus::MISSING_ANCESTOR;
    }
    if (parent->block_number >= current_.block_number) {
      return AncestorStatus::MALFORMED_CHAIN;
    }
    current_ = *parent;
    return std::nullopt;
  }

private:
  ChainEntry current_;
};

} // namespace

const char *AncestorStatusToString(AncestorStatus status) noexcept {
  switch (status) {
    case AncestorStatus::FOUND: return "found";
    case AncestorStatus::UNKNOWN_TIP: return "unknown-tip";
    case AncestorStatus::MISSING_ANCESTOR: return "missing-ancestor";
    case AncestorStatus::NO_COMMON_ANCESTOR: return "no-common-ancestor";
    case AncestorStatus::MALFORMED_CHAIN: return "malformed-chain";
  }
  return "unknown";
}

AncestorResult FindCommonAncestor(const ChainIndex &index, const uint256 &tip_a,
                                  const uint256 &tip_b) {
  auto entry_a = index.Lookup(tip_a);
  if (!entry_a) {
    LOG_CHAIN_DEBUG("FindCommonAncestor: unknown tip {}", tip_a.GetHex().substr(0, 16));
    return MakeResult(AncestorStatus::UNKNOWN_TIP, tip_a, 0);
  }
  auto entry_b = index.Lookup(tip_b);
  if (!entry_b) {
    LOG_CHAIN_DEBUG("FindCommonAncestor: unknown tip {}", tip_b.GetHex().substr(0, 16));
    return MakeResult(AncestorStatus::UNKNOWN_TIP, tip_b, 0);
  }

  const uint64_t max_steps =
      SaturatingAdd(SaturatingAdd(entry_a->block_number, entry_b->block_number), 2);
  uint64_t steps = 0;

  Walker a(*entry_a);
  Walker b(*entry_b);

  // Hop one side; on failure report the entry whose parent could not be used
  auto hop = [&](Walker &w) -> std::optional<AncestorResult> {
    if (++steps > max_steps) {
      LOG_CHAIN_WARN("FindCommonAncestor: walk exceeded {} steps at {}", max_steps,
                     w.current().hash.GetHex().substr(0, 16));
      return MakeResult(AncestorStatus::MALFORMED_CHAIN, w.current().hash, steps);
    }
    auto failure = w.step(index);
    if (!failure) {
      return std::nullopt;
    }
    const uint256 &culprit = *failure == AncestorStatus::MISSING_ANCESTOR
                                 ? w.current().parent_hash
                                 : w.current().hash;
    LOG_CHAIN_DEBUG("FindCommonAncestor: {} at {}", AncestorStatusToString(*failure),
                    culprit.GetHex().substr(0, 16));
    return MakeResult(*failure, culprit, steps);
  };

  while (a.current().hash != b.current().hash) {
    const uint64_t num_a = a.current().block_number;
    const uint64_t num_b = b.current().block_number;

    if (a.at_root() && b.at_root()) {
      LOG_CHAIN_DEBUG("FindCommonAncestor: disjoint chains (roots {} and {})",
                      a.current().hash.GetHex().substr(0, 16),
                      b.current().hash.GetHex().substr(0, 16));
      return MakeResult(AncestorStatus::NO_COMMON_ANCESTOR, uint256(), steps);
    }

    // The deeper side walks until heights align; equal heights walk in
    // lockstep. A side stuck at its root lets the other finish its walk so
    // that "disjoint" is only reported once both roots are reached.
    bool step_a = false;
    bool step_b = false;
    if (num_a > num_b) {
      step_a = !a.at_root();
      step_b = !step_a;
    } else if (num_b > num_a) {
      step_b = !b.at_root();
      step_a = !step_b;
    } else {
      step_a = !a.at_root();
      step_b = !b.at_root();
    }

    if (step_a) {
      if (auto failure = hop(a)) return *failure;
    }
    if (step_b) {
      if (auto failure = hop(b)) return *failure;
    }
  }

  LOG_CHAIN_DEBUG("FindCommonAncestor: {} and {} meet at {} after {} steps",
                  tip_a.GetHex().substr(0, 16), tip_b.GetHex().substr(0, 16),
                  a.current().hash.GetHex().substr(0, 16), steps);
  return MakeResult(AncestorStatus::FOUND, a.current().hash, steps);
}

AncestorResult FindCommonAncestor(const ChainIndex &index,
                                  const std::vector<uint256> &tips) {
  if (tips.empty()) {
    return MakeResult(AncestorStatus::UNKNOWN_TIP, uint256(), 0);
  }

  if (!index.Contains(tips.front())) {
    return MakeResult(AncestorStatus::UNKNOWN_TIP, tips.front(), 0);
  }

  uint256 acc = tips.front();
  uint64_t total_steps = 0;
  for (size_t i = 1; i < tips.size(); ++i) {
    AncestorResult result = FindCommonAncestor(index, acc, tips[i]);
    total_steps += result.steps;
    if (!result.Found()) {
      result.steps = total_steps;
      return result;
    }
    acc = result.ancestor;
  }

  return MakeResult(AncestorStatus::FOUND, acc, total_steps);
}

} // namespace chain
} // namespace forkscan
