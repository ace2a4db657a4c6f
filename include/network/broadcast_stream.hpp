// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "transport/chunk_codec.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include <asio/ip/udp.hpp>

namespace kadcast {
namespace network {

struct ReceivedBroadcast {
  std::vector<uint8_t> payload;
  // Peer whose datagram completed the reassembly (not necessarily the originator)
  asio::ip::udp::endpoint source;
  // Diffusion height the message arrived with
  uint8_t height{0};
  transport::MessageId message_id{};
};

/**
 * BroadcastStream - queue of delivered broadcasts, consumed by the application
 *
 * Unbounded; producers never block. Once closed, pending items can still be
 * drained but nothing new is accepted and waiting consumers wake up.
 * Cannot be reopened.
 */
class BroadcastStream {
public:
  BroadcastStream() = default;

  BroadcastStream(const BroadcastStream&) = delete;
  BroadcastStream& operator=(const BroadcastStream&) = delete;

  // Returns false if the stream is closed.
  bool push(ReceivedBroadcast item);

  // Wait up to `timeout` for the next item. std::nullopt on timeout or when
  // the stream is closed and empty.
  std::optional<ReceivedBroadcast> next(std::chrono::milliseconds timeout);

  std::optional<ReceivedBroadcast> try_next();

  void close();
  bool is_closed() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ReceivedBroadcast> queue_;
  bool closed_{false};
};

}  // namespace network
}  // namespace kadcast
