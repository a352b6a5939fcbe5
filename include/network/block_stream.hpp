// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_index.hpp"
#include "network/byte_source.hpp"
#include "network/frame_decoder.hpp"
#include "util/hash.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace forkscan {
namespace network {

enum class StreamState : uint8_t {
  IDLE,             // not started
  RUNNING,          // reading from its source
  FINISHED,         // source reached end of stream
  POISONED,         // fatal decode or validation error
  CANCELLED,        // cancel() observed before end of stream
  TRANSPORT_ERROR,  // source reported a read failure
  FAILED            // internal failure (hash collaborator threw)
};

[[nodiscard]] const char *StreamStateToString(StreamState state) noexcept;

// Terminal states: the stream will not read again
inline bool IsTerminal(StreamState state) {
  return state != StreamState::IDLE && state != StreamState::RUNNING;
}

// Optional persistence collaborator. Receives every block this stream newly
// inserts into the chain index, in stream order; duplicates are not passed
// on. Called from the stream's thread; implementations shared between
// streams must lock.
class BlockSink {
public:
  virtual ~BlockSink() = default;
  virtual void on_block(const chain::CBlock &block, const uint256 &hash,
                        std::span<const uint8_t> frame) = 0;
};

/**
 * FrameArchive - Appends admitted frames to a file
 *
 * The archive is a plain concatenation of wire frames, so it can be read back
 * as an input stream. Write failures are logged and counted; they never
 * affect ingestion.
 */
class FrameArchive : public BlockSink {
public:
  explicit FrameArchive(std::filesystem::path path);

  FrameArchive(const FrameArchive &) = delete;
  FrameArchive &operator=(const FrameArchive &) = delete;

  bool is_open() const;
  void on_block(const chain::CBlock &block, const uint256 &hash,
                std::span<const uint8_t> frame) override;
  void flush();

  uint64_t frames_written() const { return frames_written_.load(); }
  uint64_t write_failures() const { return write_failures_.load(); }

private:
  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::ofstream file_;
  std::atomic<uint64_t> frames_written_{0};
  std::atomic<uint64_t> write_failures_{0};
};

// Counters are updated by the owning worker and may be read from any thread
struct StreamStats {
  uint64_t bytes_read{0};
  uint64_t frames_decoded{0};
  uint64_t blocks_inserted{0};
  uint64_t duplicates{0};
  uint64_t conflicts{0};
  uint64_t discarded_bytes{0};  // partial frame dropped at end or cancel
};

/**
 * BlockStream - Drives one byte source into the shared chain index
 *
 * Owns one FrameDecoder. Every decoded frame is checked by CheckBlock, hashed
 * with the supplied hash function and inserted into the index. Within a
 * stream, blocks are inserted in the order their bytes arrive.
 *
 * Outcomes:
 * - decode or validation failure: the stream is POISONED and stops reading
 * - conflicting re-insert: the frame is dropped and counted, the stream goes on
 * - duplicate: counted, no index change
 * - end of stream with a partial frame buffered: FINISHED, bytes discarded
 *
 * cancel() may be called from any thread. It closes the active source so a
 * blocked read returns, and no frame is admitted after it is observed.
 */
class BlockStream {
public:
  struct Config {
    uint32_t max_payload_length = DEFAULT_MAX_PAYLOAD_LENGTH;
    size_t read_chunk_size = 4096;
  };

  BlockStream(uint64_t id, chain::ChainIndex &index, util::HashFunction hash_fn,
              Config config, BlockSink *sink = nullptr);

  BlockStream(const BlockStream &) = delete;
  BlockStream &operator=(const BlockStream &) = delete;

  // Read `source` until end of stream, error or cancel. Returns the final
  // state. A stream runs once.
  StreamState run(ByteSource &source);

  // Feed one chunk directly (used by run() and by tests). Returns false once
  // the stream is poisoned or cancelled.
  bool process_chunk(std::span<const uint8_t> chunk);

  void cancel();
  bool is_cancelled() const { return cancelled_.load(); }

  uint64_t id() const { return id_; }
  StreamState state() const { return state_.load(); }
  DecodeError decode_error() const { return decode_error_.load(); }
  std::string error_message() const;
  StreamStats stats() const;

  // Hash of the last block admitted (inserted or duplicate)
  std::optional<uint256> tip() const;

private:
  bool admit(const chain::CBlock &block);
  void poison(DecodeError error, const std::string &message);
  void finish(StreamState state, const std::string &message = {});

  const uint64_t id_;
  chain::ChainIndex &index_;
  util::HashFunction hash_fn_;
  const Config config_;
  BlockSink *sink_;

  // Only touched by the thread running the stream
  FrameDecoder decoder_;

  std::atomic<StreamState> state_{StreamState::IDLE};
  std::atomic<DecodeError> decode_error_{DecodeError::NONE};
  std::atomic<bool> cancelled_{false};

  std::atomic<uint64_t> bytes_read_{0};
  std::atomic<uint64_t> blocks_inserted_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> conflicts_{0};
  std::atomic<uint64_t> frames_decoded_{0};
  std::atomic<uint64_t> discarded_bytes_{0};

  mutable std::mutex mutex_;  // guards error_message_, tip_, source_
  std::string error_message_;
  std::optional<uint256> tip_;
  ByteSource *source_{nullptr};
};

} // namespace network
} // namespace forkscan
