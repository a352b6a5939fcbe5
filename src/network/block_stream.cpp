// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/block_stream.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include <exception>
#include <vector>

namespace forkscan {
namespace network {

const char *StreamStateToString(StreamState state) noexcept {
  switch (state) {
    case StreamState::IDLE: return "idle";
    case StreamState::RUNNING: return "running";
    case StreamState::FINISHED: return "finished";
    case StreamState::POISONED: return "poisoned";
    case StreamState::CANCELLED: return "cancelled";
    case StreamState::TRANSPORT_ERROR: return "transport-error";
    case StreamState::FAILED: return "failed";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// FrameArchive
// ---------------------------------------------------------------------------

FrameArchive::FrameArchive(std::filesystem::path path)
    : path_(std::move(path)), file_(path_, std::ios::binary | std::ios::app) {
  if (!file_.is_open()) {
    LOG_CHAIN_ERROR("FrameArchive: cannot open {} for append", path_.string());
  }
}

bool FrameArchive::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FrameArchive::on_block(const chain::CBlock &block, const uint256 &hash,
                            std::span<const uint8_t> frame) {
  (void)block;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    write_failures_.fetch_add(1);
    return;
  }
  file_.write(reinterpret_cast<const char *>(frame.data()),
              static_cast<std::streamsize>(frame.size()));
  if (!file_) {
    write_failures_.fetch_add(1);
    LOG_CHAIN_WARN("FrameArchive: write of block {} to {} failed",
                   hash.ToString().substr(0, 16), path_.string());
    file_.clear();
    return;
  }
  frames_written_.fetch_add(1);
}

void FrameArchive::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

// ---------------------------------------------------------------------------
// BlockStream
// ---------------------------------------------------------------------------

BlockStream::BlockStream(uint64_t id, chain::ChainIndex &index,
                         util::HashFunction hash_fn, Config config, BlockSink *sink)
    : id_(id), index_(index), hash_fn_(std::move(hash_fn)), config_(config),
      sink_(sink), decoder_(config.max_payload_length) {}

StreamState BlockStream::run(ByteSource &source) {
  StreamState expected = StreamState::IDLE;
  if (!state_.compare_exchange_strong(expected, StreamState::RUNNING)) {
    LOG_NET_WARN("stream {} already ran (state={})", id_, StreamStateToString(expected));
    return expected;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    source_ = &source;
  }
  // cancel() may have landed before the source was registered
  if (cancelled_.load()) {
    source.close();
  }

  LOG_NET_DEBUG("stream {} reading from {}", id_, source.describe());

  const size_t chunk_size = config_.read_chunk_size > 0 ? config_.read_chunk_size : 4096;
  std::vector<uint8_t> chunk;
  chunk.reserve(chunk_size);

  StreamState final_state = StreamState::FINISHED;
  std::string message;

  try {
    while (true) {
      if (cancelled_.load()) {
        final_state = StreamState::CANCELLED;
        break;
      }

      ReadStatus status = source.read_some(chunk, chunk_size);
      if (status == ReadStatus::DATA) {
        bytes_read_.fetch_add(chunk.size());
        if (!process_chunk(chunk)) {
          final_state = StreamState::CANCELLED;  // unless poisoned, see below
          break;
        }
        continue;
      }

      if (cancelled_.load()) {
        final_state = StreamState::CANCELLED;
      } else if (status == ReadStatus::END_OF_STREAM) {
        final_state = StreamState::FINISHED;
      } else {
        final_state = StreamState::TRANSPORT_ERROR;
        message = source.last_error();
      }
      break;
    }
  } catch (const std::exception &e) {
    final_state = StreamState::FAILED;
    message = e.what();
    LOG_NET_ERROR("stream {} failed: {}", id_, message);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    source_ = nullptr;
  }

  if (state_.load() == StreamState::POISONED) {
    return StreamState::POISONED;
  }
  finish(final_state, message);
  return final_state;
}

bool BlockStream::process_chunk(std::span<const uint8_t> chunk) {
  if (state_.load() == StreamState::POISONED || cancelled_.load()) {
    return false;
  }

  std::vector<chain::CBlock> frames;
  bool ok = decoder_.feed(chunk, frames);
  frames_decoded_.fetch_add(frames.size());

  // Frames that completed before a decode error are still admitted
  for (const auto &block : frames) {
    if (cancelled_.load()) {
      return false;
    }
    if (!admit(block)) {
      return false;
    }
  }

  if (!ok) {
    poison(decoder_.error(), decoder_.error_message());
    return false;
  }
  return true;
}

bool BlockStream::admit(const chain::CBlock &block) {
  validation::ValidationState state;
  if (!validation::CheckBlock(block, state)) {
    poison(DecodeError::MALFORMED, "block at height " +
                                       std::to_string(block.header.nBlockNumber) +
                                       " rejected: " + state.ToString());
    return false;
  }

  std::vector<uint8_t> frame = block.Serialize();
  uint256 hash = hash_fn_(frame);

  const chain::InsertResult result =
      index_.Insert(hash, block.header.hashParent, block.header.nBlockNumber);
  switch (result) {
    case chain::InsertResult::INSERTED:
      blocks_inserted_.fetch_add(1);
      break;
    case chain::InsertResult::DUPLICATE:
      duplicates_.fetch_add(1);
      LOG_NET_TRACE("stream {}: duplicate block {}", id_, hash.ToString().substr(0, 16));
      break;
    case chain::InsertResult::CONFLICT:
      // Dropped; the stream itself is still well-formed
      conflicts_.fetch_add(1);
      LOG_NET_WARN("stream {}: block {} conflicts with indexed entry, dropped",
                   id_, hash.ToString().substr(0, 16));
      return true;
    case chain::InsertResult::INVALID:
      poison(DecodeError::MALFORMED,
             "block " + hash.ToString().substr(0, 16) + " has an invalid identity");
      return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    tip_ = hash;
  }

  // Duplicates already reached the sink through whichever stream inserted them
  if (sink_ && result == chain::InsertResult::INSERTED) {
    sink_->on_block(block, hash, frame);
  }
  return true;
}

void BlockStream::poison(DecodeError error, const std::string &message) {
  discarded_bytes_.fetch_add(decoder_.discard_partial());
  decode_error_.store(error);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error_message_ = message;
  }
  state_.store(StreamState::POISONED);
  LOG_NET_WARN("stream {} poisoned ({}): {}", id_, DecodeErrorToString(error), message);
}

void BlockStream::finish(StreamState state, const std::string &message) {
  size_t dropped = decoder_.discard_partial();
  if (dropped > 0) {
    discarded_bytes_.fetch_add(dropped);
    LOG_NET_WARN("stream {}: discarded {} bytes of incomplete frame", id_, dropped);
  }
  if (!message.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_message_ = message;
  }
  state_.store(state);

  if (state == StreamState::TRANSPORT_ERROR) {
    LOG_NET_WARN("stream {} transport error: {}", id_, message);
  } else {
    LOG_NET_DEBUG("stream {} {} after {} bytes, {} blocks inserted", id_,
                  StreamStateToString(state), bytes_read_.load(), blocks_inserted_.load());
  }
}

void BlockStream::cancel() {
  if (cancelled_.exchange(true)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (source_) {
    source_->close();
  }
}

std::string BlockStream::error_message() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_message_;
}

StreamStats BlockStream::stats() const {
  StreamStats s;
  s.bytes_read = bytes_read_.load();
  s.frames_decoded = frames_decoded_.load();
  s.blocks_inserted = blocks_inserted_.load();
  s.duplicates = duplicates_.load();
  s.conflicts = conflicts_.load();
  s.discarded_bytes = discarded_bytes_.load();
  return s;
}

std::optional<uint256> BlockStream::tip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_;
}

} // namespace network
} // namespace forkscan
