// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program_name) {
  std::cout << "plebnet gossip daemon\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --host=<addr>              Address advertised to peers (default: 127.0.0.1)\n"
            << "  --port=<port>              Listen port (default: 8001)\n"
            << "  --id=<id>                  Node id (default: generated, kept in datadir)\n"
            << "  --datadir=<path>           Data directory (default: ~/.plebnet)\n"
            << "  --peer=<id>@<host>:<port>  Initial contact (repeatable)\n"
            << "  --restore-timeout=<secs>   Evict contacts unreachable this long (default: 3600)\n"
            << "  --ping-interval=<secs>     Probe unreachable contacts this often (default: 1799)\n"
            << "  --notify-interval=<ms>     Inbound delivery batching, 0 = immediate (default: 1000)\n"
            << "  --loglevel=<level>         trace, debug, info, warn, error, off (default: info)\n"
            << "  --debug=<component>        Debug logging for network or gossip\n"
            << "  --version                  Show version information\n"
            << "  --help                     Show this help message\n"
            << std::endl;
}

// Whole-string unsigned parse; false on junk or overflow past max
bool ParseUnsigned(const std::string& value, uint64_t max, uint64_t& out) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 19) {
    return false;
  }
  out = std::stoull(value);
  return out <= max;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    plebnet::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      uint64_t number = 0;

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << plebnet::GetFullVersionString() << std::endl;
        std::cout << plebnet::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--host=")) {
        config.host = arg.substr(7);
        if (config.host.empty()) {
          std::cerr << "Error: --host requires a value\n";
          return 1;
        }
      } else if (arg.starts_with("--port=")) {
        if (!ParseUnsigned(arg.substr(7), 65535, number) || number == 0) {
          std::cerr << "Error: invalid port: " << arg.substr(7) << "\n";
          return 1;
        }
        config.port = static_cast<uint16_t>(number);
      } else if (arg.starts_with("--id=")) {
        config.node_id = arg.substr(5);
        if (config.node_id.empty()) {
          std::cerr << "Error: --id requires a non-empty value\n";
          return 1;
        }
      } else if (arg.starts_with("--datadir=")) {
        config.datadir = arg.substr(10);
        if (config.datadir.empty()) {
          std::cerr << "Error: --datadir requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--peer=")) {
        auto peer = plebnet::app::ParsePeerArg(arg.substr(7));
        if (!peer) {
          std::cerr << "Error: invalid --peer (expected <id>@<host>:<port>): " << arg.substr(7) << "\n";
          return 1;
        }
        config.peers.push_back(*peer);
      } else if (arg.starts_with("--restore-timeout=")) {
        if (!ParseUnsigned(arg.substr(18), 365ULL * 24 * 3600, number)) {
          std::cerr << "Error: invalid --restore-timeout: " << arg.substr(18) << "\n";
          return 1;
        }
        config.book_config.contact_restore_timeout = std::chrono::seconds(number);
      } else if (arg.starts_with("--ping-interval=")) {
        if (!ParseUnsigned(arg.substr(16), 365ULL * 24 * 3600, number) || number == 0) {
          std::cerr << "Error: invalid --ping-interval: " << arg.substr(16) << "\n";
          return 1;
        }
        config.book_config.inactive_ping_interval = std::chrono::seconds(number);
      } else if (arg.starts_with("--notify-interval=")) {
        if (!ParseUnsigned(arg.substr(18), 3600ULL * 1000, number)) {
          std::cerr << "Error: invalid --notify-interval: " << arg.substr(18) << "\n";
          return 1;
        }
        config.book_config.receiver_notify_interval = std::chrono::milliseconds(number);
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--debug=")) {
        debug_components.push_back(arg.substr(8));
      } else {
        std::cerr << "Error: unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (config.datadir.empty()) {
      config.datadir = plebnet::util::get_default_datadir();
      if (config.datadir.empty()) {
        std::cerr << "Error: HOME environment variable not set.\n"
                  << "Please set HOME or use --datadir explicitly.\n";
        return 1;
      }
    }

    // debug.log lives in the datadir, so it has to exist before logging starts
    if (!plebnet::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: cannot create data directory " << config.datadir.string() << "\n";
      return 1;
    }

    plebnet::util::LogManager::Initialize(log_level, true, (config.datadir / "debug.log").string());
    for (const auto& component : debug_components) {
      plebnet::util::LogManager::SetComponentLevel(component, "debug");
    }

    int rc = 0;
    {
      plebnet::app::Application app(config);
      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        rc = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start application");
        rc = 1;
      } else {
        app.wait_for_shutdown();
      }
    }

    plebnet::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
