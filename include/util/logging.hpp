// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace plebnet {
namespace util {

/**
 * LogManager - component loggers on top of spdlog
 *
 * Components: "default", "network" (transport), "gossip" (address book
 * protocol and eviction). Unknown component names resolve to "default".
 *
 * Thread-safety: every method takes the registry mutex. Loggers already
 * handed out stay valid across Initialize()/Shutdown().
 */
class LogManager {
public:
  // (Re)builds every component logger with the given level and sinks.
  // An empty log_file_path with log_to_file=true falls back to console only.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flushes and drops all loggers. Later GetLogger() calls re-initialize.
  static void Shutdown();

  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);

  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace plebnet

#define LOG_TRACE(...) plebnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) plebnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) plebnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) plebnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) plebnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) plebnet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) plebnet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) plebnet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) plebnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) plebnet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_GOSSIP_TRACE(...) plebnet::util::LogManager::GetLogger("gossip")->trace(__VA_ARGS__)
#define LOG_GOSSIP_DEBUG(...) plebnet::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__)
#define LOG_GOSSIP_INFO(...) plebnet::util::LogManager::GetLogger("gossip")->info(__VA_ARGS__)
#define LOG_GOSSIP_WARN(...) plebnet::util::LogManager::GetLogger("gossip")->warn(__VA_ARGS__)
#define LOG_GOSSIP_ERROR(...) plebnet::util::LogManager::GetLogger("gossip")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For lines triggered by remote input (malformed frames, unknown commands).
// 200 lines per hour per callsite.

#include "util/rate_limiter.hpp"

#define PLEBNET_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (plebnet::util::RateLimiter::instance().should_log(PLEBNET_CALLSITE_KEY_, 200, 3600)) {                         \
      plebnet::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                       \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (plebnet::util::RateLimiter::instance().should_log(PLEBNET_CALLSITE_KEY_, 200, 3600)) {                         \
      plebnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_GOSSIP_DEBUG_RL(...)                                                                                       \
  do {                                                                                                                 \
    if (plebnet::util::RateLimiter::instance().should_log(PLEBNET_CALLSITE_KEY_, 200, 3600)) {                         \
      plebnet::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)
