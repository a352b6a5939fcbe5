// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/ingest_manager.hpp"
#include "util/logging.hpp"
#include <chrono>
#include <future>
#include <system_error>

namespace forkscan {
namespace network {

IngestManager::IngestManager(chain::ChainIndex &index, util::HashFunction hash_fn,
                             Config config, BlockSink *sink)
    : index_(index), hash_fn_(std::move(hash_fn)), config_(config), sink_(sink) {}

IngestManager::~IngestManager() { shutdown(); }

uint64_t IngestManager::add_stream(ByteSourcePtr source, std::string label) {
  if (!source) {
    return 0;
  }

  // shutdown_ is only read and set under mutex_, so a stream registered here
  // is always seen by the cancel_all() that follows a shutdown
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    LOG_NET_DEBUG("rejecting stream {}: ingest manager is shut down", source->describe());
    return 0;
  }

  reap_finished_locked();
  if (config_.max_streams > 0 && running_locked() >= config_.max_streams) {
    LOG_NET_WARN("rejecting stream {}: {} streams already running", source->describe(),
                 config_.max_streams);
    return 0;
  }

  const uint64_t id = next_id_;

  auto entry = std::make_unique<StreamEntry>();
  entry->stream = std::make_unique<BlockStream>(id, index_, hash_fn_, config_.stream, sink_);
  entry->label = label.empty() ? source->describe() : std::move(label);
  entry->source = std::move(source);

  StreamEntry *raw = entry.get();
  std::promise<StreamState> finished;
  entry->done = finished.get_future().share();
  try {
    entry->worker = std::thread([this, raw, finished = std::move(finished)]() mutable {
      finished.set_value(run_stream(raw));
    });
  } catch (const std::system_error &e) {
    LOG_NET_WARN("cannot start stream {}: {}", entry->label, e.what());
    return 0;
  }

  ++next_id_;
  LOG_NET_INFO("stream {} added ({})", id, entry->label);
  streams_.emplace(id, std::move(entry));
  return id;
}

StreamState IngestManager::run_stream(StreamEntry *entry) {
  StreamState state = entry->stream->run(*entry->source);
  entry->source.reset();
  return state;
}

void IngestManager::reap_finished_locked() {
  for (auto &[id, entry] : streams_) {
    if (entry->worker.joinable() &&
        entry->done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      entry->worker.join();
    }
  }
}

size_t IngestManager::running_locked() const {
  size_t n = 0;
  for (const auto &[id, entry] : streams_) {
    if (entry->done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++n;
    }
  }
  return n;
}

void IngestManager::wait_all() {
  // Streams may be added while waiting (listener), so loop until none remain
  while (true) {
    std::vector<std::shared_future<StreamState>> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &[id, entry] : streams_) {
        if (entry->done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
          pending.push_back(entry->done);
        }
      }
    }
    if (pending.empty()) {
      return;
    }
    for (auto &f : pending) {
      f.wait();
    }
  }
}

void IngestManager::cancel_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, entry] : streams_) {
    entry->stream->cancel();
  }
}

void IngestManager::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
  }
  cancel_all();
  wait_all();

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, entry] : streams_) {
    if (entry->worker.joinable()) {
      entry->worker.join();
    }
  }
}

std::vector<StreamReport> IngestManager::reports() const {
  std::vector<StreamReport> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(streams_.size());
  for (const auto &[id, entry] : streams_) {
    StreamReport r;
    r.id = id;
    r.label = entry->label;
    r.state = entry->stream->state();
    r.error = entry->stream->decode_error();
    r.error_message = entry->stream->error_message();
    r.stats = entry->stream->stats();
    r.tip = entry->stream->tip();
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<StreamReport> IngestManager::report(uint64_t id) const {
  for (auto &r : reports()) {
    if (r.id == id) {
      return r;
    }
  }
  return std::nullopt;
}

std::vector<uint256> IngestManager::stream_tips() const {
  std::vector<uint256> tips;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, entry] : streams_) {
    if (auto tip = entry->stream->tip()) {
      tips.push_back(*tip);
    }
  }
  return tips;
}

chain::AncestorResult IngestManager::find_common_ancestor() const {
  std::vector<uint256> tips = stream_tips();
  chain::AncestorResult result = chain::FindCommonAncestor(index_, tips);
  LOG_CHAIN_DEBUG("common ancestor of {} stream tips: {}", tips.size(),
                  chain::AncestorStatusToString(result.status));
  return result;
}

size_t IngestManager::stream_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.size();
}

size_t IngestManager::active_streams() const {
  size_t n = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, entry] : streams_) {
    if (entry->stream->state() == StreamState::RUNNING) {
      ++n;
    }
  }
  return n;
}

} // namespace network
} // namespace forkscan
