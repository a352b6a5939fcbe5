// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_index.hpp"
#include "network/block_stream.hpp"
#include "network/frame_decoder.hpp"
#include "network/ingest_manager.hpp"
#include "network/tcp_source.hpp"
#include "util/files.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace forkscan {
namespace app {

// Concurrently running streams (input files plus accepted connections)
static constexpr size_t DEFAULT_MAX_STREAMS = 125;

// Application configuration
struct AppConfig {
  // Data directory (chain_index.json, debug.log, blocks.dat)
  std::filesystem::path datadir;

  // One ingestion stream per input file
  std::vector<std::filesystem::path> inputs;

  // Accept TCP connections, one stream per connection
  bool listen_enabled = false;
  uint16_t listen_port = 0;

  // Ingestion tunables
  uint32_t max_payload_length = network::DEFAULT_MAX_PAYLOAD_LENGTH;
  size_t max_streams = DEFAULT_MAX_STREAMS;  // 0 = unlimited

  // Explicit ancestor query run after ingestion
  std::optional<std::pair<uint256, uint256>> resolve;

  // Persistence
  bool save_index = true;
  bool archive = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();

  // Returns when every input stream has ended (file-only runs) or when a
  // shutdown is requested
  void wait_for_shutdown();

  // Component access
  chain::ChainIndex &chain_index() { return *chain_index_; }
  network::IngestManager &ingest_manager() { return *ingest_manager_; }

  // Status
  bool is_running() const { return running_; }

  // 0 on success, 2 if any stream ended in error
  int exit_code() const { return exit_code_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  int exit_code_{0};

  // Components (initialized in order)
  std::unique_ptr<chain::ChainIndex> chain_index_;
  std::unique_ptr<network::FrameArchive> archive_;
  // IMPORTANT: the listener owns the io_context that accepted TCP sources
  // belong to, so it is declared BEFORE ingest_manager_ (destroyed after it)
  std::unique_ptr<network::StreamListener> listener_;
  std::unique_ptr<network::IngestManager> ingest_manager_;

  // Periodic save thread (listen mode)
  std::unique_ptr<std::thread> save_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_index();
  bool init_ingest();

  // Periodic saves
  void start_periodic_saves();
  void stop_periodic_saves();
  void periodic_save_loop();
  void save_index();

  // Results
  bool all_streams_done() const;
  void report_results();

  // Shutdown
  void shutdown();

  std::filesystem::path index_file() const { return config_.datadir / "chain_index.json"; }

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace forkscan
