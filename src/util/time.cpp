// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace kadcast {
namespace util {

namespace {

// 0 means mock time is disabled
std::atomic<int64_t> g_mock_time{0};

// Anchor used to translate mock seconds into steady_clock time points.
// Captured the first time GetSteadyTime() runs under mock time and
// released when mocking is disabled.
struct SteadyAnchor {
  std::mutex mutex;
  bool valid{false};
  std::chrono::steady_clock::time_point real_base;
  int64_t mock_base{0};
};

SteadyAnchor& Anchor() {
  static SteadyAnchor anchor;
  return anchor;
}

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  auto& anchor = Anchor();
  std::lock_guard<std::mutex> lock(anchor.mutex);
  if (!anchor.valid) {
    anchor.real_base = std::chrono::steady_clock::now();
    anchor.mock_base = mock;
    anchor.valid = true;
  }
  return anchor.real_base + std::chrono::seconds(mock - anchor.mock_base);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    auto& anchor = Anchor();
    std::lock_guard<std::mutex> lock(anchor.mutex);
    anchor.valid = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace kadcast
