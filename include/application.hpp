// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include "network/address_book.hpp"
#include "network/contact.hpp"
#include "network/protocol.hpp"
#include "util/fs_lock.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace plebnet {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;

  // Address advertised to peers; the receiver listens on all interfaces
  std::string host{"127.0.0.1"};
  uint16_t port{protocol::ports::DEFAULT};

  // Generated (and remembered in the datadir) when empty
  std::string node_id;

  // --peer arguments, merged over contacts.json
  std::vector<network::Contact> peers;

  network::AddressBook::Config book_config;
  std::chrono::milliseconds send_timeout{protocol::DEFAULT_SEND_TIMEOUT};
  std::chrono::seconds save_interval{std::chrono::minutes(5)};
};

// Parse "<id>@<host>:<port>". nullopt on any syntax error or port 0.
std::optional<network::Contact> ParsePeerArg(const std::string& arg);

/**
 * Application - wires the TCP transport to an AddressBook and owns the
 * daemon lifecycle: datadir + lock, identity, contacts.json load/save,
 * signal-driven shutdown.
 */
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  bool initialize();
  bool start();
  void stop();

  // Block until SIGINT/SIGTERM or request_shutdown(), then shut down
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }
  const std::string& node_id() const { return node_id_; }
  network::AddressBook* address_book() { return address_book_.get(); }

  std::filesystem::path contacts_file() const { return config_.datadir / "contacts.json"; }
  std::filesystem::path node_id_file() const { return config_.datadir / "node_id"; }

  static Application* instance();

private:
  bool init_datadir();
  bool init_identity();
  bool load_contacts();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  void start_periodic_saves();
  void stop_periodic_saves();
  void periodic_save_loop();
  void save_contacts();
  void shutdown();

  AppConfig config_;
  std::string node_id_;
  std::vector<network::Contact> initial_contacts_;

  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::unique_ptr<network::AddressBook> address_book_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::unique_ptr<std::thread> save_thread_;

  static Application* instance_;
};

}  // namespace app
}  // namespace plebnet
