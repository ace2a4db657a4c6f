// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace kadcast {
namespace util {

// Wall-clock time in seconds since the epoch (mockable).
int64_t GetTime();

// Steady clock used for every TTL, timeout and liveness decision.
// When mock time is active the steady clock advances with the mock value,
// so tests can expire cache entries and bucket probes deterministically.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in seconds (0 disables mocking).
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII helper for tests: enables mock time for the lifetime of the object
// and restores real time on destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t start_time) { SetMockTime(start_time); }
  ~MockTimeScope() { SetMockTime(0); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

  void advance(std::chrono::seconds delta) { SetMockTime(GetMockTime() + delta.count()); }
};

}  // namespace util
}  // namespace kadcast
