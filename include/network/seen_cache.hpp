// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "transport/chunk_codec.hpp"
#include "util/time.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace kadcast {
namespace network {

/**
 * SeenCache - MessageIds this node has already delivered or originated
 *
 * An entry lives for `ttl` and the cache never holds more than `max_entries`
 * (oldest first out). insert() is an atomic test-and-set, so when two io
 * threads complete the same message concurrently exactly one wins.
 */
class SeenCache {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  SeenCache(std::chrono::milliseconds ttl, size_t max_entries);

  // True if `id` was not in the cache (it is now).
  bool insert(const transport::MessageId& id, TimePoint now = util::GetSteadyTime());

  bool contains(const transport::MessageId& id, TimePoint now = util::GetSteadyTime()) const;

  // Drop expired entries. Returns how many were removed.
  size_t sweep(TimePoint now = util::GetSteadyTime());

  size_t size() const;

private:
  // Requires mutex_ held
  void drop_front();

  std::chrono::milliseconds ttl_;
  size_t max_entries_;

  mutable std::mutex mutex_;
  std::unordered_map<transport::MessageId, TimePoint, transport::MessageIdHasher> entries_;
  // Insertion order; an element is stale if entries_ holds a newer time for its id.
  std::deque<std::pair<transport::MessageId, TimePoint>> order_;
};

}  // namespace network
}  // namespace kadcast
