// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/broadcast_stream.hpp"

namespace kadcast {
namespace network {

bool BroadcastStream::push(ReceivedBroadcast item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(item));
  }
  cv_.notify_one();
  return true;
}

std::optional<ReceivedBroadcast> BroadcastStream::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  ReceivedBroadcast item = std::move(queue_.front());
  queue_.pop_front();
  return item;
}

std::optional<ReceivedBroadcast> BroadcastStream::try_next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  ReceivedBroadcast item = std::move(queue_.front());
  queue_.pop_front();
  return item;
}

void BroadcastStream::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool BroadcastStream::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t BroadcastStream::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace network
}  // namespace kadcast
