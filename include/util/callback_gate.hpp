// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Admission control for callbacks that run on threads we do not own

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace kadcast {
namespace util {

/**
 * CallbackGate - lets an object outlive nothing that still calls into it
 *
 * Callbacks posted to an io_context the object does not own may run after
 * the object has started to die. Each such callback holds a shared_ptr to the
 * gate and wraps its body in a Pass; once close() returns, no Pass admits a
 * caller and every caller admitted before has left.
 *
 * close() must not be called from inside a Pass on the same gate.
 */
class CallbackGate {
public:
  class Pass {
  public:
    explicit Pass(CallbackGate& gate) : gate_(gate), admitted_(gate.enter()) {}
    ~Pass() {
      if (admitted_) {
        gate_.leave();
      }
    }

    Pass(const Pass&) = delete;
    Pass& operator=(const Pass&) = delete;

    explicit operator bool() const { return admitted_; }

  private:
    CallbackGate& gate_;
    bool admitted_;
  };

  // Refuse new callers and wait for admitted ones to leave. Idempotent.
  void close();

  bool is_closed() const;
  size_t active() const;

private:
  bool enter();
  void leave();

  mutable std::mutex mutex_;
  std::condition_variable idle_;
  size_t active_{0};
  bool closed_{false};
};

}  // namespace util
}  // namespace kadcast
