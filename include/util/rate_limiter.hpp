// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite log throttling for messages triggered by untrusted datagrams

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace kadcast {
namespace util {

/**
 * RateLimiter - token bucket per log callsite
 *
 * Any peer can make us log by sending a malformed datagram, and UDP makes
 * that free for the sender. Each callsite (file, line) gets a bucket of
 * `burst` tokens refilled linearly over `period`. A log line costs one token;
 * when the bucket is dry the line is dropped and counted as suppressed.
 */
class RateLimiter {
public:
  struct Callsite {
    std::string_view file;
    int line{0};

    bool operator==(const Callsite& other) const { return line == other.line && file == other.file; }
  };

  bool should_log(const Callsite& site, uint32_t burst, std::chrono::seconds period);

  // Number of lines dropped at `site` since the limiter was created or reset.
  uint64_t suppressed(const Callsite& site) const;

  void reset();

  static RateLimiter& instance();

private:
  struct CallsiteHash {
    size_t operator()(const Callsite& site) const noexcept {
      return std::hash<std::string_view>{}(site.file) ^ (static_cast<size_t>(site.line) * 0x9E3779B97F4A7C15ULL);
    }
  };

  struct Bucket {
    // Tokens are tracked in millitokens so refill stays exact with integer math.
    uint64_t millitokens{0};
    std::chrono::steady_clock::time_point last_refill{};
    uint64_t suppressed{0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<Callsite, Bucket, CallsiteHash> buckets_;
};

}  // namespace util
}  // namespace kadcast
