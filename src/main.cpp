// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>
#include <limits>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Reads hash-linked block streams into a chain index and reports where\n"
      << "their tips fork.\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.forkscan)\n"
      << "  --input=<file>       Ingest a block stream from a file (repeatable)\n"
      << "  --listen=<port>      Accept block streams over TCP, one per connection\n"
      << "  --maxpayload=<n>     Maximum payload length in bytes (default: 4194304)\n"
      << "  --maxstreams=<n>     Maximum concurrently running streams (default: 125, 0 = no limit)\n"
      << "  --resolve=<a>,<b>    Find the common ancestor of two block hashes\n"
      << "  --nosave             Do not write chain_index.json\n"
      << "  --archive            Append every admitted frame to blocks.dat\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, chain, app, all\n"
      << "                       Can be comma-separated: --debug=network,chain\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    forkscan::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << forkscan::GetFullVersionString() << std::endl;
        std::cout << forkscan::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--input=") == 0) {
        std::string path = arg.substr(8);
        if (path.empty()) {
          std::cerr << "Error: --input needs a file path" << std::endl;
          return 1;
        }
        config.inputs.emplace_back(path);
      } else if (arg.find("--listen=") == 0) {
        auto port_opt = forkscan::util::SafeParsePort(arg.substr(9));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(9) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.listen_enabled = true;
        config.listen_port = *port_opt;
      } else if (arg.find("--maxpayload=") == 0) {
        auto max_opt = forkscan::util::SafeParseInt64(
            arg.substr(13), 0, std::numeric_limits<uint32_t>::max());
        if (!max_opt) {
          std::cerr << "Error: Invalid maximum payload length: " << arg.substr(13) << std::endl;
          std::cerr << "Length must be a number between 0 and 4294967295" << std::endl;
          return 1;
        }
        config.max_payload_length = static_cast<uint32_t>(*max_opt);
      } else if (arg.find("--maxstreams=") == 0) {
        auto streams_opt = forkscan::util::SafeParseInt(arg.substr(13), 0, 100000);
        if (!streams_opt) {
          std::cerr << "Error: Invalid stream limit: " << arg.substr(13) << std::endl;
          std::cerr << "Stream limit must be a number between 0 and 100000" << std::endl;
          return 1;
        }
        config.max_streams = static_cast<size_t>(*streams_opt);
      } else if (arg.find("--resolve=") == 0) {
        auto parts = forkscan::util::SplitString(arg.substr(10), ',');
        std::optional<uint256> a, b;
        if (parts.size() == 2) {
          a = forkscan::util::SafeParseHash(parts[0]);
          b = forkscan::util::SafeParseHash(parts[1]);
        }
        if (!a || !b) {
          std::cerr << "Error: --resolve expects two 64-character hex hashes separated by a comma"
                    << std::endl;
          return 1;
        }
        config.resolve = std::make_pair(*a, *b);
      } else if (arg == "--nosave") {
        config.save_index = false;
      } else if (arg == "--archive") {
        config.archive = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,chain
        for (auto &component : forkscan::util::SplitString(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!forkscan::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir.string() << std::endl;
      return 1;
    }
    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    forkscan::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        forkscan::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        forkscan::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        forkscan::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    {
      forkscan::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until every input ends or shutdown is requested
      app.wait_for_shutdown();
      exit_code = app.exit_code();
    }

    // Shutdown logging AFTER app is fully destroyed
    forkscan::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    forkscan::util::LogManager::Shutdown();
    return 1;
  }
}
