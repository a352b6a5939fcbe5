// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace forkscan {
namespace network {

enum class ReadStatus : uint8_t {
  DATA,          // `out` holds at least one byte
  END_OF_STREAM, // source is exhausted, `out` is empty
  ERROR          // transport failure, see last_error()
};

// ByteSource - Abstract pull interface over the transport carrying a stream
// Allows dependency injection of different implementations:
// - FileByteSource: a file on disk
// - MemoryByteSource: in-memory bytes with a fixed chunk schedule (tests)
// - TcpByteSource: an accepted TCP connection (boost::asio)
//
// A source is read by exactly one block stream.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Block until some bytes, end-of-stream, or an error. Replaces the
  // contents of `out` with at most `max_bytes` bytes.
  virtual ReadStatus read_some(std::vector<uint8_t> &out, size_t max_bytes) = 0;

  // Unblock a pending read_some() from another thread. Later reads report
  // END_OF_STREAM or ERROR.
  virtual void close() {}

  // Human-readable origin for logs ("file:/tmp/a.dat", "tcp:1.2.3.4:5")
  virtual std::string describe() const = 0;

  virtual std::string last_error() const { return {}; }
};

using ByteSourcePtr = std::unique_ptr<ByteSource>;

// MemoryByteSource - Serves a byte vector in chunks
//
// With a chunk schedule, the i-th read returns schedule[i % size] bytes
// (capped by max_bytes), which lets tests replay exact fragmentations.
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::vector<uint8_t> data, size_t chunk_size = 4096);
  MemoryByteSource(std::vector<uint8_t> data, std::vector<size_t> chunk_schedule);

  ReadStatus read_some(std::vector<uint8_t> &out, size_t max_bytes) override;
  void close() override { closed_ = true; }
  std::string describe() const override { return "memory"; }

  size_t position() const { return position_; }

private:
  std::vector<uint8_t> data_;
  std::vector<size_t> schedule_;
  size_t position_{0};
  size_t reads_{0};
  std::atomic<bool> closed_{false};
};

// FileByteSource - Reads a file from start to end
class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::filesystem::path path);

  // False if the file could not be opened (read_some then reports ERROR)
  bool is_open() const { return file_.is_open(); }

  // Reads never block for long, so close() keeps the default no-op and
  // cancellation is observed between chunks.
  ReadStatus read_some(std::vector<uint8_t> &out, size_t max_bytes) override;
  std::string describe() const override { return "file:" + path_.string(); }
  std::string last_error() const override { return last_error_; }

private:
  std::filesystem::path path_;
  std::ifstream file_;
  std::string last_error_;
};

} // namespace network
} // namespace forkscan
