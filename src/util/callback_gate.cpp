// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/callback_gate.hpp"

namespace kadcast {
namespace util {

bool CallbackGate::enter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  ++active_;
  return true;
}

void CallbackGate::leave() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (--active_ == 0) {
    idle_.notify_all();
  }
}

void CallbackGate::close() {
  std::unique_lock<std::mutex> lock(mutex_);
  closed_ = true;
  idle_.wait(lock, [this]() { return active_ == 0; });
}

bool CallbackGate::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t CallbackGate::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

}  // namespace util
}  // namespace kadcast
