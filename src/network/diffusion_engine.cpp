// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/diffusion_engine.hpp"

#include "util/blake2s.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <memory>

namespace kadcast {
namespace network {

DiffusionEngine::DiffusionEngine(const message::Header& local_header, routing::RoutingTable& routing_table,
                                 SeenCache& seen_cache, const transport::ChunkEncoder& encoder,
                                 transport::DatagramTransport& transport, const DiffusionConfig& config)
    : local_header_(local_header),
      routing_table_(routing_table),
      seen_cache_(seen_cache),
      encoder_(encoder),
      transport_(transport),
      config_(config),
      rng_(std::random_device{}()) {}

void DiffusionEngine::set_delivery_callback(DeliveryCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  delivery_callback_ = std::move(callback);
}

transport::MessageId DiffusionEngine::new_message_id(std::span<const uint8_t> payload) {
  // Random suffix: the same payload broadcast twice is two messages.
  std::array<uint8_t, 16> entropy{};
  {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    for (size_t i = 0; i < entropy.size(); i += 8) {
      const uint64_t v = rng_();
      for (size_t j = 0; j < 8; ++j) {
        entropy[i + j] = static_cast<uint8_t>(v >> (8 * j));
      }
    }
  }

  util::Blake2sHasher hasher;
  hasher.Write(payload).Write(entropy.data(), entropy.size());
  transport::MessageId id{};
  hasher.Finalize(id.data());
  return id;
}

std::optional<transport::MessageId> DiffusionEngine::Originate(std::span<const uint8_t> payload) {
  if (payload.size() > encoder_.max_payload_size()) {
    LOG_NET_WARN("refusing to broadcast {} bytes (limit {})", payload.size(), encoder_.max_payload_size());
    return std::nullopt;
  }

  const transport::MessageId id = new_message_id(payload);
  seen_cache_.insert(id);
  originated_.fetch_add(1, std::memory_order_relaxed);

  const size_t frames = Forward(id, payload, 0);
  LOG_NET_DEBUG("originated broadcast {} ({} bytes, {} datagrams)", transport::ShortHex(id), payload.size(), frames);
  return id;
}

bool DiffusionEngine::HandleDecoded(transport::DecodedMessage decoded, const asio::ip::udp::endpoint& source) {
  if (!seen_cache_.insert(decoded.message_id)) {
    duplicates_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_TRACE("duplicate broadcast {} from {}", transport::ShortHex(decoded.message_id),
                  util::FormatEndpoint(source));
    return false;
  }

  if (config_.auto_propagate) {
    Forward(decoded.message_id, decoded.payload, decoded.height);
  }

  ReceivedBroadcast received;
  received.payload = std::move(decoded.payload);
  received.source = source;
  received.height = decoded.height;
  received.message_id = decoded.message_id;

  delivered_.fetch_add(1, std::memory_order_relaxed);
  LOG_NET_DEBUG("delivered broadcast {} ({} bytes, height {}) via {}", transport::ShortHex(received.message_id),
                received.payload.size(), received.height, util::FormatEndpoint(source));

  DeliveryCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = delivery_callback_;
  }
  if (callback) {
    callback(std::move(received));
  }
  return true;
}

bool DiffusionEngine::Propagate(const ReceivedBroadcast& received) {
  if (received.payload.size() > encoder_.max_payload_size()) {
    return false;
  }
  Forward(received.message_id, received.payload, received.height);
  return true;
}

size_t DiffusionEngine::Forward(const transport::MessageId& message_id, std::span<const uint8_t> payload,
                                uint8_t height) {
  if (height >= protocol::ID_BITS) {
    return 0;
  }

  auto targets = routing_table_.sample_at_or_above(height, config_.beta);
  if (targets.empty()) {
    LOG_NET_TRACE("no peers at height >= {} for {}", height, transport::ShortHex(message_id));
    return 0;
  }

  auto chunks = encoder_.encode(message_id, payload);
  if (!chunks) {
    LOG_NET_WARN("cannot encode broadcast {} ({} bytes)", transport::ShortHex(message_id), payload.size());
    return 0;
  }

  size_t queued = 0;
  for (const auto& target : targets) {
    // Frames differ per bucket only in the height byte.
    std::vector<transport::DatagramPtr> frames;
    frames.reserve(chunks->size());
    for (const auto& chunk : *chunks) {
      message::Envelope envelope;
      envelope.header = local_header_;
      envelope.payload = message::BroadcastMessage{static_cast<uint8_t>(target.height + 1), chunk};
      frames.push_back(std::make_shared<const std::vector<uint8_t>>(message::Encode(envelope)));
    }

    for (const auto& peer : target.peers) {
      for (const auto& frame : frames) {
        if (transport_.send_to(peer.endpoint, frame)) {
          ++queued;
        } else {
          send_failures_.fetch_add(1, std::memory_order_relaxed);
          LOG_NET_DEBUG_RL("could not queue broadcast datagram to {}", util::FormatEndpoint(peer.endpoint));
          break;
        }
      }
    }
  }

  frames_sent_.fetch_add(queued, std::memory_order_relaxed);
  return queued;
}

DiffusionEngine::Stats DiffusionEngine::GetStats() const {
  Stats stats;
  stats.originated = originated_.load(std::memory_order_relaxed);
  stats.delivered = delivered_.load(std::memory_order_relaxed);
  stats.duplicates = duplicates_.load(std::memory_order_relaxed);
  stats.frames_sent = frames_sent_.load(std::memory_order_relaxed);
  stats.send_failures = send_failures_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace network
}  // namespace kadcast
