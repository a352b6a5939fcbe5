// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace forkscan {
namespace chain {

// ChainEntry - Metadata for one admitted block
//
// Immutable once inserted. parent_hash may name a block that is not (yet)
// in the index; the all-zero hash is the "no parent" (genesis) sentinel.
struct ChainEntry {
  uint256 hash;
  uint256 parent_hash;
  uint64_t block_number{0};

  [[nodiscard]] bool IsGenesis() const noexcept { return parent_hash.IsNull(); }

  friend bool operator==(const ChainEntry &a, const ChainEntry &b) {
    return a.hash == b.hash && a.parent_hash == b.parent_hash &&
           a.block_number == b.block_number;
  }

  [[nodiscard]] std::string ToString() const;
};

enum class InsertResult : uint8_t {
  INSERTED,  // New entry recorded
  DUPLICATE, // Identical entry already present, no state change
  CONFLICT,  // Same hash already present with different parent/number (malformed)
  INVALID    // Hash is the genesis sentinel or names itself as parent (malformed)
};

[[nodiscard]] const char *InsertResultToString(InsertResult result) noexcept;

// ChainIndex - Append-only map from block identity to ChainEntry
//
// THREAD SAFETY: All public methods are safe to call concurrently.
// Readers take a shared lock, Insert() takes an exclusive lock. Because
// entries are never mutated or removed, a duplicate insert of the same hash
// from two streams resolves to one INSERTED and one DUPLICATE.
//
// The index grows without bound; pruning is a deployment concern.
class ChainIndex {
public:
  ChainIndex() = default;
  ~ChainIndex() = default;

  ChainIndex(const ChainIndex &) = delete;
  ChainIndex &operator=(const ChainIndex &) = delete;

  [[nodiscard]] InsertResult Insert(const uint256 &hash, const uint256 &parent_hash,
                                    uint64_t block_number);
  [[nodiscard]] InsertResult Insert(const ChainEntry &entry) {
    return Insert(entry.hash, entry.parent_hash, entry.block_number);
  }

  // Returns std::nullopt when the hash is unknown
  [[nodiscard]] std::optional<ChainEntry> Lookup(const uint256 &hash) const;

  // All entries at the given block number (forks share heights). Ordered by hash.
  [[nodiscard]] std::vector<ChainEntry> LookupByHeight(uint64_t block_number) const;

  [[nodiscard]] bool Contains(const uint256 &hash) const;
  [[nodiscard]] size_t Size() const;

  // Entries that no known entry names as its parent
  [[nodiscard]] std::vector<ChainEntry> GetTips() const;

  // Entries whose parent is neither the sentinel nor present in the index
  [[nodiscard]] std::vector<ChainEntry> GetOrphans() const;

  // Snapshot to JSON (atomic write). Returns false on I/O failure.
  bool Save(const std::string &filepath) const;

  // Merge a JSON snapshot into this index. Returns false if the file is
  // unreadable, malformed, or contains an entry that conflicts with one
  // already present; entries read before the failure remain inserted.
  bool Load(const std::string &filepath);

private:
  mutable std::shared_mutex mutex_;

  // Protected by mutex_
  std::map<uint256, ChainEntry> entries_;
  std::map<uint64_t, std::vector<uint256>> by_height_;
};

} // namespace chain
} // namespace forkscan
