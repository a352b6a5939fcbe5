// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/byte_source.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace forkscan {
namespace network {

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data, size_t chunk_size)
    : data_(std::move(data)), schedule_{std::max<size_t>(chunk_size, 1)} {}

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data,
                                   std::vector<size_t> chunk_schedule)
    : data_(std::move(data)), schedule_(std::move(chunk_schedule)) {
  // Zero-sized chunks would never make progress
  schedule_.erase(std::remove(schedule_.begin(), schedule_.end(), size_t{0}),
                  schedule_.end());
  if (schedule_.empty()) {
    schedule_.push_back(1);
  }
}

ReadStatus MemoryByteSource::read_some(std::vector<uint8_t> &out, size_t max_bytes) {
  out.clear();
  if (closed_ || position_ >= data_.size() || max_bytes == 0) {
    return ReadStatus::END_OF_STREAM;
  }

  size_t want = std::min(schedule_[reads_ % schedule_.size()], max_bytes);
  size_t n = std::min(want, data_.size() - position_);
  out.assign(data_.begin() + static_cast<std::ptrdiff_t>(position_),
             data_.begin() + static_cast<std::ptrdiff_t>(position_ + n));
  position_ += n;
  ++reads_;
  return ReadStatus::DATA;
}

FileByteSource::FileByteSource(std::filesystem::path path)
    : path_(std::move(path)), file_(path_, std::ios::binary) {
  if (!file_.is_open()) {
    last_error_ = "cannot open " + path_.string();
    LOG_NET_WARN("FileByteSource: {}", last_error_);
  }
}

ReadStatus FileByteSource::read_some(std::vector<uint8_t> &out, size_t max_bytes) {
  out.clear();
  if (!file_.is_open()) {
    return ReadStatus::ERROR;
  }
  if (max_bytes == 0) {
    return ReadStatus::END_OF_STREAM;
  }

  out.resize(max_bytes);
  file_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(max_bytes));
  std::streamsize got = file_.gcount();
  out.resize(static_cast<size_t>(got));

  if (got > 0) {
    return ReadStatus::DATA;
  }
  if (file_.eof()) {
    return ReadStatus::END_OF_STREAM;
  }

  last_error_ = "read failed on " + path_.string();
  return ReadStatus::ERROR;
}

} // namespace network
} // namespace forkscan
