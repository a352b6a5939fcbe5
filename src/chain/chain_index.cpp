// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_index.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace forkscan {
namespace chain {

namespace {
constexpr int SNAPSHOT_FORMAT_VERSION = 1;
} // namespace

std::string ChainEntry::ToString() const {
  std::ostringstream ss;
  ss << "ChainEntry(hash=" << hash.GetHex().substr(0, 16)
     << ", parent=" << (IsGenesis() ? std::string("genesis") : parent_hash.GetHex().substr(0, 16))
     << ", number=" << block_number << ")";
  return ss.str();
}

const char *InsertResultToString(InsertResult result) noexcept {
  switch (result) {
    case InsertResult::INSERTED: return "inserted";
    case InsertResult::DUPLICATE: return "duplicate";
    case InsertResult::CONFLICT: return "conflict";
    case InsertResult::INVALID: return "invalid";
  }
  return "unknown";
}

InsertResult ChainIndex::Insert(const uint256 &hash, const uint256 &parent_hash,
                                uint64_t block_number) {
  if (hash.IsNull() || hash == parent_hash) {
    LOG_CHAIN_WARN("Rejecting entry with invalid identity hash={} parent={}",
                   hash.GetHex().substr(0, 16), parent_hash.GetHex().substr(0, 16));
    return InsertResult::INVALID;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = entries_.find(hash);
  if (it != entries_.end()) {
    const ChainEntry &existing = it->second;
    if (existing.parent_hash == parent_hash && existing.block_number == block_number) {
      LOG_CHAIN_TRACE("Duplicate entry {} ignored", hash.GetHex().substr(0, 16));
      return InsertResult::DUPLICATE;
    }
    LOG_CHAIN_WARN("Conflicting entry for {}: have parent={} number={}, got parent={} number={}",
                   hash.GetHex().substr(0, 16),
                   existing.parent_hash.GetHex().substr(0, 16), existing.block_number,
                   parent_hash.GetHex().substr(0, 16), block_number);
    return InsertResult::CONFLICT;
  }

  entries_.emplace(hash, ChainEntry{hash, parent_hash, block_number});
  auto &bucket = by_height_[block_number];
  bucket.insert(std::lower_bound(bucket.begin(), bucket.end(), hash), hash);

  LOG_CHAIN_TRACE("Inserted entry {} at number {}", hash.GetHex().substr(0, 16), block_number);
  return InsertResult::INSERTED;
}

std::optional<ChainEntry> ChainIndex::Lookup(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ChainEntry> ChainIndex::LookupByHeight(uint64_t block_number) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ChainEntry> result;

  auto it = by_height_.find(block_number);
  if (it == by_height_.end()) {
    return result;
  }

  result.reserve(it->second.size());
  for (const auto &hash : it->second) {
    result.push_back(entries_.at(hash));
  }
  return result;
}

bool ChainIndex::Contains(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.count(hash) > 0;
}

size_t ChainIndex::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

std::vector<ChainEntry> ChainIndex::GetTips() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::set<uint256> parents;
  for (const auto &[hash, entry] : entries_) {
    if (!entry.IsGenesis()) {
      parents.insert(entry.parent_hash);
    }
  }

  std::vector<ChainEntry> tips;
  for (const auto &[hash, entry] : entries_) {
    if (parents.count(hash) == 0) {
      tips.push_back(entry);
    }
  }
  return tips;
}

std::vector<ChainEntry> ChainIndex::GetOrphans() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<ChainEntry> orphans;
  for (const auto &[hash, entry] : entries_) {
    if (!entry.IsGenesis() && entries_.count(entry.parent_hash) == 0) {
      orphans.push_back(entry);
    }
  }
  return orphans;
}

bool ChainIndex::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  try {
    json root;
    json entries = json::array();
    {
      std::shared_lock<std::shared_mutex> lock(mutex_);

      root["version"] = SNAPSHOT_FORMAT_VERSION;
      root["entry_count"] = entries_.size();

      // Height order makes the file readable and diffable
      for (const auto &[number, hashes] : by_height_) {
        for (const auto &hash : hashes) {
          const ChainEntry &entry = entries_.at(hash);
          json item;
          item["hash"] = entry.hash.GetHex();
          item["parent_hash"] = entry.parent_hash.GetHex();
          item["block_number"] = entry.block_number;
          entries.push_back(std::move(item));
        }
      }
    }
    root["entries"] = std::move(entries);

    LOG_CHAIN_DEBUG("Saving {} chain entries to {}", root["entry_count"].get<size_t>(), filepath);

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_CHAIN_ERROR("Failed to write chain index snapshot: {}", filepath);
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool ChainIndex::Load(const std::string &filepath) {
  using json = nlohmann::json;

  try {
    std::string contents = util::read_file_string(filepath);
    if (contents.empty()) {
      LOG_CHAIN_DEBUG("Chain index snapshot not found or empty: {}", filepath);
      return false;
    }

    json root = json::parse(contents);

    int version = root.value("version", 0);
    if (version != SNAPSHOT_FORMAT_VERSION) {
      LOG_CHAIN_ERROR("Unsupported chain index snapshot version: {}", version);
      return false;
    }

    if (!root.contains("entries") || !root["entries"].is_array()) {
      LOG_CHAIN_ERROR("Chain index snapshot missing 'entries' array");
      return false;
    }

    const json &entries = root["entries"];
    size_t entry_count = root.value("entry_count", entries.size());
    if (entry_count != entries.size()) {
      LOG_CHAIN_WARN("Entry count mismatch: header says {}, array has {}. Using array size.",
                     entry_count, entries.size());
    }

    size_t loaded = 0;
    for (const auto &item : entries) {
      if (!item.contains("hash") || !item.contains("parent_hash") ||
          !item.contains("block_number")) {
        LOG_CHAIN_ERROR("Snapshot entry missing required field. File corrupted.");
        return false;
      }

      auto hash = util::SafeParseHash(item["hash"].get<std::string>());
      auto parent = util::SafeParseHash(item["parent_hash"].get<std::string>());
      if (!hash || !parent) {
        LOG_CHAIN_ERROR("Snapshot entry has malformed hash. File corrupted.");
        return false;
      }

      InsertResult result = Insert(*hash, *parent, item["block_number"].get<uint64_t>());
      if (result == InsertResult::CONFLICT || result == InsertResult::INVALID) {
        LOG_CHAIN_ERROR("Snapshot entry {} rejected: {}", hash->GetHex().substr(0, 16),
                        InsertResultToString(result));
        return false;
      }
      ++loaded;
    }

    LOG_CHAIN_INFO("Loaded {} chain entries from {}", loaded, filepath);
    return true;
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Exception during Load: {}", e.what());
    return false;
  }
}

} // namespace chain
} // namespace forkscan
