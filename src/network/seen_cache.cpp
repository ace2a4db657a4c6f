// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/seen_cache.hpp"

namespace kadcast {
namespace network {

SeenCache::SeenCache(std::chrono::milliseconds ttl, size_t max_entries) : ttl_(ttl), max_entries_(max_entries) {}

void SeenCache::drop_front() {
  const auto& [id, inserted_at] = order_.front();
  auto it = entries_.find(id);
  if (it != entries_.end() && it->second == inserted_at) {
    entries_.erase(it);
  }
  order_.pop_front();
}

bool SeenCache::insert(const transport::MessageId& id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it != entries_.end() && now - it->second < ttl_) {
    return false;
  }

  entries_[id] = now;
  order_.emplace_back(id, now);
  while (entries_.size() > max_entries_ && !order_.empty()) {
    drop_front();
  }
  return true;
}

bool SeenCache::contains(const transport::MessageId& id, TimePoint now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it != entries_.end() && now - it->second < ttl_;
}

size_t SeenCache::sweep(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t before = entries_.size();
  while (!order_.empty() && now - order_.front().second >= ttl_) {
    drop_front();
  }
  return before - entries_.size();
}

size_t SeenCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace network
}  // namespace kadcast
