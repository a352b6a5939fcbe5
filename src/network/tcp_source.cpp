// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_source.hpp"
#include "util/logging.hpp"
#include <sys/socket.h>

namespace forkscan {
namespace network {

using tcp = boost::asio::ip::tcp;

TcpByteSource::TcpByteSource(tcp::socket socket) : socket_(std::move(socket)) {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  remote_ = ec ? std::string("unknown")
               : ep.address().to_string() + ":" + std::to_string(ep.port());
}

TcpByteSource::~TcpByteSource() {
  boost::system::error_code ec;
  socket_.close(ec);
}

ReadStatus TcpByteSource::read_some(std::vector<uint8_t> &out, size_t max_bytes) {
  out.clear();
  if (closed_.load() || max_bytes == 0) {
    return ReadStatus::END_OF_STREAM;
  }

  out.resize(max_bytes);
  boost::system::error_code ec;
  size_t n = socket_.read_some(boost::asio::buffer(out.data(), out.size()), ec);
  out.resize(n);

  if (n > 0) {
    return ReadStatus::DATA;
  }
  if (ec == boost::asio::error::eof || closed_.load()) {
    return ReadStatus::END_OF_STREAM;
  }

  last_error_ = ec.message();
  LOG_NET_DEBUG("read from {} failed: {}", remote_, last_error_);
  return ReadStatus::ERROR;
}

void TcpByteSource::close() {
  if (closed_.exchange(true)) {
    return;
  }
  // shutdown(2) on the descriptor is safe against a concurrent blocking
  // read; the socket object itself is only closed by its reader.
  ::shutdown(socket_.native_handle(), SHUT_RDWR);
}

StreamListener::StreamListener() = default;

StreamListener::~StreamListener() { stop(); }

bool StreamListener::start(uint16_t port, AcceptCallback callback) {
  if (running_.load()) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(callback);

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const boost::system::system_error &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_.store(ec ? port : ep.port());
  } catch (const boost::system::system_error &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }

  LOG_NET_INFO("listening for block streams on port {}", listening_port_.load());

  io_context_.restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(io_context_));
  start_accept();
  running_.store(true);
  io_thread_ = std::thread([this]() { io_context_.run(); });
  return true;
}

void StreamListener::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Close the acceptor on its own thread to avoid racing the accept handler
  boost::asio::post(io_context_, [this]() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
  });

  work_guard_.reset();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  acceptor_.reset();
  listening_port_.store(0);
}

void StreamListener::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void StreamListener::handle_accept(const boost::system::error_code &ec,
                                   tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  auto source = std::make_unique<TcpByteSource>(std::move(socket));
  LOG_NET_DEBUG("block stream connection from {} accepted", source->describe());
  accepted_.fetch_add(1);

  if (accept_callback_) {
    try {
      accept_callback_(std::move(source));
    } catch (const std::exception &e) {
      LOG_NET_WARN("exception in accept callback: {}", e.what());
    }
  }

  start_accept();
}

} // namespace network
} // namespace forkscan
