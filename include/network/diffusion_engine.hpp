// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/broadcast_stream.hpp"
#include "network/config.hpp"
#include "network/message.hpp"
#include "network/seen_cache.hpp"
#include "routing/routing_table.hpp"
#include "transport/chunk_codec.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace kadcast {
namespace network {

/**
 * DiffusionEngine - height-bounded broadcast over the routing table
 *
 * A message received with height h is forwarded to up to beta random peers
 * of every non-empty bucket b >= h, each copy carrying height b + 1. The
 * receiver in bucket b shares exactly b leading bits with us, so it only
 * covers the subtree below that prefix and the copies never overlap.
 *
 * Each message is reassembled, checked against the SeenCache and re-encoded
 * before it travels on; a message is delivered to the application once.
 *
 * Thread-safety: all methods may be called concurrently from io threads.
 */
class DiffusionEngine {
public:
  using DeliveryCallback = std::function<void(ReceivedBroadcast)>;

  struct Stats {
    uint64_t originated{0};
    uint64_t delivered{0};
    uint64_t duplicates{0};
    uint64_t frames_sent{0};
    uint64_t send_failures{0};
  };

  DiffusionEngine(const message::Header& local_header, routing::RoutingTable& routing_table, SeenCache& seen_cache,
                  const transport::ChunkEncoder& encoder, transport::DatagramTransport& transport,
                  const DiffusionConfig& config);

  DiffusionEngine(const DiffusionEngine&) = delete;
  DiffusionEngine& operator=(const DiffusionEngine&) = delete;

  void set_delivery_callback(DeliveryCallback callback);

  // Start a new broadcast from height 0. Returns the fresh MessageId, or
  // std::nullopt if the payload exceeds the codec's max_payload_size.
  std::optional<transport::MessageId> Originate(std::span<const uint8_t> payload);

  // A message finished reassembly. Duplicates are dropped; a new message is
  // forwarded (when auto_propagate is on) and then delivered.
  // Returns true if the message was new.
  bool HandleDecoded(transport::DecodedMessage decoded, const asio::ip::udp::endpoint& source);

  // Forward a previously delivered broadcast at the height it arrived with.
  // Used when auto_propagate is off. Returns false if the payload is too large.
  bool Propagate(const ReceivedBroadcast& received);

  // Send `payload` to the peers responsible for heights >= `height`.
  // Returns the number of datagrams queued.
  size_t Forward(const transport::MessageId& message_id, std::span<const uint8_t> payload, uint8_t height);

  Stats GetStats() const;

private:
  transport::MessageId new_message_id(std::span<const uint8_t> payload);

  message::Header local_header_;
  routing::RoutingTable& routing_table_;
  SeenCache& seen_cache_;
  const transport::ChunkEncoder& encoder_;
  transport::DatagramTransport& transport_;
  DiffusionConfig config_;

  mutable std::mutex callback_mutex_;
  DeliveryCallback delivery_callback_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;

  std::atomic<uint64_t> originated_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> frames_sent_{0};
  std::atomic<uint64_t> send_failures_{0};
};

}  // namespace network
}  // namespace kadcast
