// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace plebnet {
namespace util {

// Current unix time in seconds. Returns the mock value when one is set.
int64_t GetTime();

// Monotonic clock that follows mock time once mock time is enabled, so
// token buckets and other steady-clock users advance with SetMockTime().
std::chrono::steady_clock::time_point GetSteadyTime();

// Override the clock for tests. 0 restores the real clock.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// Sets mock time for the lifetime of the scope and restores the previous
// value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

  void Advance(int64_t seconds) { SetMockTime(GetMockTime() + seconds); }

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace plebnet
