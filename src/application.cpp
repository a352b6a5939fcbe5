// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/common_ancestor.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace forkscan {
namespace app {

namespace {

void PrintAncestor(const std::string &what, const chain::AncestorResult &result) {
  if (result.Found()) {
    std::cout << what << ": " << result.ancestor.GetHex() << " (" << result.steps
              << " steps)" << std::endl;
  } else {
    std::cout << what << ": " << chain::AncestorStatusToString(result.status);
    if (!result.unresolved.IsNull()) {
      std::cout << " at " << result.unresolved.GetHex();
    }
    std::cout << std::endl;
  }
}

} // namespace

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_INFO("Initializing {}...", GetFullVersionString());

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_index()) {
    LOG_ERROR("Failed to initialize chain index");
    return false;
  }

  if (!init_ingest()) {
    LOG_ERROR("Failed to initialize ingest manager");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  if (config_.inputs.empty() && !config_.listen_enabled) {
    LOG_ERROR("Nothing to ingest: give at least one --input or --listen");
    return false;
  }

  setup_signal_handlers();
  running_ = true;

  for (const auto &input : config_.inputs) {
    auto source = std::make_unique<network::FileByteSource>(input);
    if (ingest_manager_->add_stream(std::move(source), input.string()) == 0) {
      LOG_ERROR("Failed to start stream for {}", input.string());
    }
  }

  if (config_.listen_enabled) {
    listener_ = std::make_unique<network::StreamListener>();
    bool ok = listener_->start(config_.listen_port, [this](network::ByteSourcePtr source) {
      std::string label = source->describe();
      ingest_manager_->add_stream(std::move(source), std::move(label));
    });
    if (!ok) {
      LOG_ERROR("Failed to listen on port {}", config_.listen_port);
      return false;
    }
    start_periodic_saves();
    LOG_INFO("Press Ctrl+C to stop");
  }

  LOG_INFO("forkscan started ({} input streams)", config_.inputs.size());
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // File-only runs end by themselves once every stream is done
  while (running_ && !shutdown_requested_) {
    if (!config_.listen_enabled && all_streams_done()) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  shutdown();
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down forkscan...");

  running_ = false;

  stop_periodic_saves();

  // Stop accepting first so no stream is added after cancellation
  if (listener_) {
    LOG_INFO("Stopping stream listener...");
    listener_->stop();
  }

  if (ingest_manager_) {
    if (shutdown_requested_) {
      LOG_INFO("Cancelling streams...");
      ingest_manager_->cancel_all();
    }
    ingest_manager_->wait_all();
    report_results();
    ingest_manager_->shutdown();
  }

  if (archive_) {
    archive_->flush();
    LOG_INFO("Archived {} frames", archive_->frames_written());
  }

  save_index();

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_index() {
  LOG_INFO("Initializing chain index...");
  chain_index_ = std::make_unique<chain::ChainIndex>();

  std::error_code ec;
  if (!std::filesystem::exists(index_file(), ec)) {
    LOG_INFO("No existing chain index found, starting empty");
    return true;
  }

  if (!chain_index_->Load(index_file().string())) {
    LOG_ERROR("Failed to load chain index from {}", index_file().string());
    return false;
  }

  LOG_INFO("Loaded {} chain entries from disk", chain_index_->Size());
  return true;
}

bool Application::init_ingest() {
  LOG_INFO("Initializing ingest manager...");

  if (config_.archive) {
    auto path = config_.datadir / "blocks.dat";
    archive_ = std::make_unique<network::FrameArchive>(path);
    if (!archive_->is_open()) {
      LOG_ERROR("Cannot open frame archive {}", path.string());
      return false;
    }
  }

  network::IngestManager::Config ingest_config;
  ingest_config.max_streams = config_.max_streams;
  ingest_config.stream.max_payload_length = config_.max_payload_length;

  ingest_manager_ = std::make_unique<network::IngestManager>(
      *chain_index_, util::DefaultHashFunction(), ingest_config, archive_.get());
  return true;
}

bool Application::all_streams_done() const {
  for (const auto &report : ingest_manager_->reports()) {
    if (!network::IsTerminal(report.state)) {
      return false;
    }
  }
  return true;
}

void Application::report_results() {
  for (const auto &r : ingest_manager_->reports()) {
    switch (r.state) {
      case network::StreamState::POISONED:
      case network::StreamState::TRANSPORT_ERROR:
      case network::StreamState::FAILED:
        exit_code_ = 2;
        LOG_WARN("stream {} ({}) {}: {}", r.id, r.label, network::StreamStateToString(r.state),
                 r.error_message);
        break;
      default:
        break;
    }

    std::cout << "stream " << r.id << " [" << r.label << "] "
              << network::StreamStateToString(r.state) << ": " << r.stats.frames_decoded
              << " frames, " << r.stats.blocks_inserted << " inserted, "
              << r.stats.duplicates << " duplicate, " << r.stats.conflicts << " conflicting";
    if (r.error != network::DecodeError::NONE) {
      std::cout << ", error " << network::DecodeErrorToString(r.error);
    }
    if (r.tip) {
      std::cout << ", tip " << r.tip->GetHex();
    }
    std::cout << std::endl;
  }

  std::cout << "chain index: " << chain_index_->Size() << " entries, "
            << chain_index_->GetTips().size() << " tips, " << chain_index_->GetOrphans().size()
            << " orphans" << std::endl;

  if (ingest_manager_->stream_tips().size() >= 2) {
    PrintAncestor("common ancestor of stream tips", ingest_manager_->find_common_ancestor());
  }

  if (config_.resolve) {
    auto result = chain::FindCommonAncestor(*chain_index_, config_.resolve->first,
                                            config_.resolve->second);
    PrintAncestor("common ancestor", result);
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

void Application::start_periodic_saves() {
  if (!config_.save_index) {
    return;
  }
  LOG_INFO("Starting periodic chain index saves (every 10 minutes)");
  save_thread_ = std::make_unique<std::thread>(&Application::periodic_save_loop, this);
}

void Application::stop_periodic_saves() {
  if (save_thread_ && save_thread_->joinable()) {
    LOG_DEBUG("Stopping periodic save thread");
    save_thread_->join();
    save_thread_.reset();
  }
}

void Application::periodic_save_loop() {
  using namespace std::chrono;

  const auto save_interval = minutes(10);
  auto last_save = steady_clock::now();

  while (running_) {
    std::this_thread::sleep_for(seconds(1));

    if (!running_)
      break;

    auto now = steady_clock::now();
    if (now - last_save >= save_interval) {
      save_index();
      last_save = now;
    }
  }
}

void Application::save_index() {
  if (!chain_index_ || !config_.save_index) {
    return;
  }

  LOG_DEBUG("Saving chain index to {}", index_file().string());
  if (!chain_index_->Save(index_file().string())) {
    LOG_ERROR("Failed to save chain index");
  } else {
    LOG_DEBUG("Chain index saved ({} entries)", chain_index_->Size());
  }
}

} // namespace app
} // namespace forkscan
