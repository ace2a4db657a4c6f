// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace kadcast {
namespace util {

bool RateLimiter::should_log(const Callsite& site, uint32_t burst, std::chrono::seconds period) {
  if (burst == 0) {
    return false;
  }

  const uint64_t capacity = static_cast<uint64_t>(burst) * 1000;
  const auto now = GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(site);
  Bucket& bucket = it->second;

  if (inserted) {
    bucket.millitokens = capacity;
    bucket.last_refill = now;
  } else if (now > bucket.last_refill && period.count() > 0) {
    const auto elapsed_ms =
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now - bucket.last_refill).count());
    const uint64_t period_ms = static_cast<uint64_t>(period.count()) * 1000;
    // burst tokens per period => burst millitokens per period second
    const uint64_t refill = elapsed_ms * capacity / period_ms;
    if (refill > 0) {
      bucket.millitokens = std::min(capacity, bucket.millitokens + refill);
      bucket.last_refill = now;
    }
  }

  if (bucket.millitokens >= 1000) {
    bucket.millitokens -= 1000;
    return true;
  }
  ++bucket.suppressed;
  return false;
}

uint64_t RateLimiter::suppressed(const Callsite& site) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(site);
  return it == buckets_.end() ? 0 : it->second.suppressed;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace kadcast
