// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "application.hpp"

#include "network/real_transport.hpp"
#include "util/files.hpp"
#include "util/identity.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <unistd.h>  // write(), STDOUT_FILENO (async-signal-safe)

namespace plebnet {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

std::optional<network::Contact> ParsePeerArg(const std::string& arg) {
  const auto at = arg.find('@');
  const auto colon = arg.rfind(':');
  if (at == std::string::npos || at == 0 || colon == std::string::npos || colon <= at + 1 ||
      colon + 1 >= arg.size()) {
    return std::nullopt;
  }

  std::string host = arg.substr(at + 1, colon - at - 1);
  // [::1]:8001
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  if (host.empty()) {
    return std::nullopt;
  }

  const std::string port_str = arg.substr(colon + 1);
  if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
    return std::nullopt;
  }
  const unsigned long port = std::stoul(port_str);
  if (port == 0 || port > 65535) {
    return std::nullopt;
  }

  return network::Contact(arg.substr(0, at), std::move(host), static_cast<uint16_t>(port));
}

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  LOG_INFO("Initializing plebnet...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_identity()) {
    LOG_ERROR("Failed to determine node identity");
    return false;
  }

  std::cout << GetStartupBanner(node_id_) << std::flush;

  if (!load_contacts()) {
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

  LOG_INFO("Starting plebnet...");

  setup_signal_handlers();

  try {
    address_book_ = std::make_unique<network::AddressBook>(
        network::Contact(node_id_, config_.host, config_.port), initial_contacts_,
        std::make_shared<network::TcpMessageSender>(config_.send_timeout),
        std::make_shared<network::TcpMessageReceiver>(), config_.book_config);
  } catch (const std::exception& e) {
    LOG_ERROR("Failed to start address book: {}", e.what());
    return false;
  }

  running_ = true;
  start_periodic_saves();

  LOG_INFO("plebnet started as {} on {}:{}", node_id_, config_.host, config_.port);
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down plebnet...");

  stop_periodic_saves();

  if (address_book_) {
    LOG_INFO("Stopping address book...");
    address_book_->Stop();
    save_contacts();
  }

  if (datadir_lock_) {
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    LOG_ERROR("Data directory is not set and HOME is unavailable. "
              "Use --datadir to specify one explicitly.");
    return false;
  }

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Owner-only access
  std::error_code ec;
  std::filesystem::permissions(config_.datadir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    LOG_WARN("Could not restrict permissions on {}: {}", config_.datadir.string(), ec.message());
  }

  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir);
  switch (datadir_lock_->Acquire()) {
    case util::LockResult::Success:
      break;
    case util::LockResult::ErrorWrite:
      LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
      return false;
    case util::LockResult::ErrorLock:
      LOG_ERROR("Cannot obtain a lock on data directory {}. plebnetd is probably already running.",
                config_.datadir.string());
      return false;
  }

  LOG_DEBUG("Locked data directory {}", config_.datadir.string());
  return true;
}

bool Application::init_identity() {
  if (!config_.node_id.empty()) {
    node_id_ = config_.node_id;
    LOG_INFO("Using node id {} from command line", node_id_);
    return true;
  }

  if (auto stored = util::read_file_string(node_id_file())) {
    std::string id = *stored;
    while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) {
      id.pop_back();
    }
    if (!id.empty()) {
      node_id_ = id;
      LOG_INFO("Loaded node id {}", node_id_);
      return true;
    }
    LOG_WARN("{} is empty, generating a new node id", node_id_file().string());
  }

  try {
    node_id_ = util::GenerateContactId();
  } catch (const std::runtime_error& e) {
    LOG_ERROR("Node id generation failed: {}", e.what());
    return false;
  }

  if (!util::atomic_write_file(node_id_file(), node_id_ + "\n", 0600)) {
    LOG_ERROR("Failed to write {}", node_id_file().string());
    return false;
  }
  LOG_INFO("Generated node id {}", node_id_);
  return true;
}

bool Application::load_contacts() {
  // Command-line peers take precedence over stored ones with the same id
  initial_contacts_ = config_.peers;

  const auto path = contacts_file();
  auto stored = network::AddressBook::LoadContacts(path.string());
  if (!stored) {
    LOG_ERROR("Contacts file {} is corrupted. Delete it to start from --peer only.", path.string());
    return false;
  }

  initial_contacts_.insert(initial_contacts_.end(), stored->begin(), stored->end());
  LOG_INFO("Loaded {} stored contacts, {} from command line", stored->size(), config_.peers.size());
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Broken connections surface as write errors, not SIGPIPE
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    instance_->shutdown_requested_ = true;
  }
}

void Application::start_periodic_saves() {
  LOG_DEBUG("Saving contacts every {}s", config_.save_interval.count());
  save_thread_ = std::make_unique<std::thread>(&Application::periodic_save_loop, this);
}

void Application::stop_periodic_saves() {
  if (save_thread_ && save_thread_->joinable()) {
    save_thread_->join();
    save_thread_.reset();
  }
}

void Application::periodic_save_loop() {
  using namespace std::chrono;

  auto last_save = steady_clock::now();
  while (running_) {
    std::this_thread::sleep_for(milliseconds(200));
    if (!running_) {
      break;
    }

    auto now = steady_clock::now();
    if (now - last_save >= config_.save_interval) {
      save_contacts();
      last_save = now;
    }
  }
}

void Application::save_contacts() {
  if (!address_book_) {
    return;
  }

  const auto path = contacts_file();
  if (!address_book_->SaveContacts(path.string())) {
    LOG_ERROR("Failed to save contacts to {}", path.string());
    return;
  }
  LOG_DEBUG("Saved {} contacts to {}", address_book_->size(), path.string());
}

}  // namespace app
}  // namespace plebnet
