// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/byte_source.hpp"
#include <atomic>
#include <utility>  // must precede boost/asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace forkscan {
namespace network {

/**
 * TcpByteSource - Blocking reads from one accepted TCP connection
 *
 * Read on the stream's own worker thread (boost::asio synchronous
 * read_some). close() shuts the native socket down so that a read blocked
 * in another thread returns.
 *
 * The socket belongs to the StreamListener's io_context, which must outlive
 * this object.
 */
class TcpByteSource : public ByteSource {
public:
  explicit TcpByteSource(boost::asio::ip::tcp::socket socket);
  ~TcpByteSource() override;

  TcpByteSource(const TcpByteSource &) = delete;
  TcpByteSource &operator=(const TcpByteSource &) = delete;

  ReadStatus read_some(std::vector<uint8_t> &out, size_t max_bytes) override;
  void close() override;
  std::string describe() const override { return "tcp:" + remote_; }
  std::string last_error() const override { return last_error_; }

private:
  boost::asio::ip::tcp::socket socket_;
  std::string remote_;
  std::string last_error_;
  std::atomic<bool> closed_{false};
};

/**
 * StreamListener - Accepts TCP connections and hands each one out as a
 * ByteSource
 *
 * Runs its own io_context on a single thread. The accept callback is invoked
 * on that thread and must not block (IngestManager::add_stream only queues).
 */
class StreamListener {
public:
  using AcceptCallback = std::function<void(ByteSourcePtr)>;

  StreamListener();
  ~StreamListener();

  StreamListener(const StreamListener &) = delete;
  StreamListener &operator=(const StreamListener &) = delete;

  // Bind (dual-stack with IPv4 fallback) and start accepting.
  // Port 0 binds an ephemeral port, see listening_port().
  bool start(uint16_t port, AcceptCallback callback);

  // Stop accepting and join the io thread. Idempotent.
  void stop();

  bool is_running() const { return running_.load(); }
  uint16_t listening_port() const { return listening_port_.load(); }
  uint64_t connections_accepted() const { return accepted_.load(); }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  AcceptCallback accept_callback_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> listening_port_{0};
  std::atomic<uint64_t> accepted_{0};
};

} // namespace network
} // namespace forkscan
