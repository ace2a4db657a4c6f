// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// DatagramTransport that records every datagram instead of sending it

#pragma once

#include "network/message.hpp"
#include "transport/transport.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <variant>
#include <vector>

namespace kadcast {
namespace test {

class RecordingTransport : public transport::DatagramTransport {
public:
  struct Sent {
    transport::Endpoint to;
    transport::DatagramPtr data;

    std::optional<message::Envelope> decode() const { return message::Decode(*data); }
  };

  explicit RecordingTransport(const transport::Endpoint& endpoint) : endpoint_(endpoint) {}

  bool start() override {
    running_ = true;
    return true;
  }
  void stop() override { running_ = false; }
  bool is_running() const override { return running_; }

  bool send_to(const transport::Endpoint& to, transport::DatagramPtr data) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || refused_.count(to) != 0) {
      return false;
    }
    sent_.push_back(Sent{to, std::move(data)});
    return true;
  }

  void set_receive_callback(transport::ReceiveCallback callback) override { receive_callback_ = std::move(callback); }
  void set_send_error_callback(transport::SendErrorCallback callback) override {
    send_error_callback_ = std::move(callback);
  }

  transport::Endpoint local_endpoint() const override { return endpoint_; }

  // send_to() returns false for this destination
  void Refuse(const transport::Endpoint& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    refused_.insert(to);
  }

  std::vector<Sent> TakeSent() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Sent> out;
    out.swap(sent_);
    return out;
  }

  size_t SentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_.size();
  }

  // Decoded messages of one type sent so far (not consumed)
  template <typename T>
  std::vector<std::pair<transport::Endpoint, T>> SentOfType() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<transport::Endpoint, T>> out;
    for (const auto& sent : sent_) {
      auto envelope = sent.decode();
      if (envelope && std::holds_alternative<T>(envelope->payload)) {
        out.emplace_back(sent.to, std::get<T>(envelope->payload));
      }
    }
    return out;
  }

  void Receive(const transport::Endpoint& from, const std::vector<uint8_t>& data) {
    if (receive_callback_) {
      receive_callback_(from, data.data(), data.size());
    }
  }

private:
  transport::Endpoint endpoint_;
  bool running_{true};
  mutable std::mutex mutex_;
  std::vector<Sent> sent_;
  std::set<transport::Endpoint> refused_;
  transport::ReceiveCallback receive_callback_;
  transport::SendErrorCallback send_error_callback_;
};

}  // namespace test
}  // namespace kadcast
