// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace plebnet {
namespace util {

/**
 * RateLimiter - per-callsite token bucket for log output
 *
 * Every inbound frame is attacker controlled, so log lines triggered by
 * malformed or unknown messages go through this limiter. Each callsite
 * starts with a full bucket of tokens_per_period tokens that refills
 * linearly over period_seconds.
 */
class RateLimiter {
public:
  // Returns true if the callsite still has a token, consuming it.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace plebnet
