// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_index.hpp"
#include "chain/common_ancestor.hpp"
#include "network/block_stream.hpp"
#include "network/byte_source.hpp"
#include "util/hash.hpp"
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace forkscan {
namespace network {

// Snapshot of one stream, safe to take while the stream runs
struct StreamReport {
  uint64_t id{0};
  std::string label;
  StreamState state{StreamState::IDLE};
  DecodeError error{DecodeError::NONE};
  std::string error_message;
  StreamStats stats;
  std::optional<uint256> tip;
};

/**
 * IngestManager - Runs many block streams against one chain index
 *
 * Each stream runs on its own thread; a stream's decoder is only ever
 * advanced by that thread, and a stream blocked on its transport never
 * delays another. Streams share nothing but the chain index (and the
 * optional sink), so a poisoned stream never affects others.
 *
 * max_streams caps how many streams may be running at once; add_stream
 * refuses new streams past the cap instead of queueing them.
 */
class IngestManager {
public:
  struct Config {
    size_t max_streams = 0;  // concurrently running streams, 0 = unlimited
    BlockStream::Config stream;
  };

  IngestManager(chain::ChainIndex &index, util::HashFunction hash_fn, Config config,
                BlockSink *sink = nullptr);

  // Cancels every stream and joins their threads
  ~IngestManager();

  IngestManager(const IngestManager &) = delete;
  IngestManager &operator=(const IngestManager &) = delete;

  // Start a stream on its own thread. Returns its id (> 0), or 0 if the
  // manager is shut down, the source is null or max_streams are running.
  uint64_t add_stream(ByteSourcePtr source, std::string label);

  // Block until every stream added so far (and any added meanwhile) is done
  void wait_all();

  // Cancel every running stream. Does not wait.
  void cancel_all();

  // Refuse new streams, cancel_all(), wait_all(), join threads. Idempotent.
  void shutdown();

  std::vector<StreamReport> reports() const;
  std::optional<StreamReport> report(uint64_t id) const;

  // Last admitted hash of each stream that admitted at least one block, in
  // stream id order
  std::vector<uint256> stream_tips() const;

  // Lowest common ancestor of all stream tips
  chain::AncestorResult find_common_ancestor() const;

  size_t stream_count() const;
  size_t active_streams() const;

private:
  struct StreamEntry {
    std::unique_ptr<BlockStream> stream;
    ByteSourcePtr source;  // released by the worker when the stream ends
    std::string label;
    std::shared_future<StreamState> done;
    std::thread worker;
  };

  StreamState run_stream(StreamEntry *entry);

  // Join threads of finished streams. Caller holds mutex_.
  void reap_finished_locked();
  size_t running_locked() const;

  chain::ChainIndex &index_;
  util::HashFunction hash_fn_;
  const Config config_;
  BlockSink *sink_;

  mutable std::mutex mutex_;
  std::map<uint64_t, std::unique_ptr<StreamEntry>> streams_;
  uint64_t next_id_{1};
  bool shutdown_{false};  // guarded by mutex_
};

} // namespace network
} // namespace forkscan
