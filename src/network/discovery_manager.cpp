// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/discovery_manager.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <memory>

namespace kadcast {
namespace network {

DiscoveryManager::DiscoveryManager(const message::Header& local_header, routing::RoutingTable& routing_table,
                                   transport::DatagramTransport& transport, const DiscoveryConfig& config,
                                   const routing::BucketConfig& bucket_config)
    : local_header_(local_header),
      routing_table_(routing_table),
      transport_(transport),
      config_(config),
      bucket_config_(bucket_config),
      rng_(std::random_device{}()) {}

void DiscoveryManager::send(const asio::ip::udp::endpoint& to, message::Payload payload) {
  message::Envelope envelope{local_header_, std::move(payload)};
  const auto type = envelope.type();
  auto datagram = std::make_shared<const std::vector<uint8_t>>(message::Encode(envelope));
  if (!transport_.send_to(to, std::move(datagram))) {
    LOG_NET_DEBUG_RL("could not queue {} to {}", protocol::MessageTypeName(type), util::FormatEndpoint(to));
  }
}

void DiscoveryManager::probe(const routing::PeerInfo& peer, TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!probes_.emplace(peer.id(), now + config_.ping_timeout).second) {
      return;
    }
  }
  pings_sent_.fetch_add(1, std::memory_order_relaxed);
  send(peer.endpoint, message::PingMessage{});
}

void DiscoveryManager::find_nodes(const asio::ip::udp::endpoint& to, const routing::NodeId& target) {
  lookups_sent_.fetch_add(1, std::memory_order_relaxed);
  send(to, message::FindNodesMessage{target});
}

bool DiscoveryManager::OnMessage(const message::Header& header, const asio::ip::udp::endpoint& from,
                                 TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    probes_.erase(header.sender.id);
  }

  auto result = routing_table_.insert_or_refresh(header.sender, from, now);
  switch (result.outcome) {
    case routing::InsertOutcome::INSERTED:
      peers_learned_.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_TRACE("added peer {} at {}", routing::ToHex(header.sender.id), util::FormatEndpoint(from));
      break;
    case routing::InsertOutcome::PENDING:
      if (result.eviction_candidate) {
        probe(*result.eviction_candidate, now);
      }
      break;
    case routing::InsertOutcome::INVALID:
      LOG_NET_DEBUG_RL("rejected identity of {}", util::FormatEndpoint(from));
      return false;
    case routing::InsertOutcome::UPDATED:
    case routing::InsertOutcome::FULL:
      break;
  }
  return true;
}

void DiscoveryManager::HandlePing(const asio::ip::udp::endpoint& from) {
  send(from, message::PongMessage{});
}

void DiscoveryManager::HandleFindNodes(const message::Header& header, const message::FindNodesMessage& msg,
                                       const asio::ip::udp::endpoint& from) {
  auto closest = routing_table_.closest_peers(msg.target, protocol::MAX_NODES_PER_RESPONSE, header.sender.id);

  message::NodesMessage reply;
  reply.peers.reserve(closest.size());
  for (const auto& peer : closest) {
    reply.peers.push_back(message::PeerEntry{peer.binary, peer.endpoint});
  }
  LOG_NET_TRACE("answering find_nodes from {} with {} peers", util::FormatEndpoint(from), reply.peers.size());
  send(from, std::move(reply));
}

void DiscoveryManager::HandleNodes(const message::NodesMessage& msg, TimePoint now) {
  for (const auto& entry : msg.peers) {
    if (entry.binary.id == local_header_.sender.id) {
      continue;
    }
    if (routing::ComputeNodeId(entry.endpoint) != entry.binary.id) {
      LOG_NET_DEBUG_RL("ignoring nodes entry {} whose id does not match its address",
                       util::FormatEndpoint(entry.endpoint));
      continue;
    }
    if (routing_table_.has_peer(entry.binary.id)) {
      continue;
    }

    auto result = routing_table_.insert_or_refresh(entry.binary, entry.endpoint, now);
    if (result.outcome == routing::InsertOutcome::INSERTED) {
      peers_learned_.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_DEBUG("learned peer {} at {}", routing::ToHex(entry.binary.id), util::FormatEndpoint(entry.endpoint));
      if (config_.recursive_discovery) {
        if (auto peer = routing_table_.find_peer(entry.binary.id)) {
          probe(*peer, now);
        }
      }
    } else if (result.outcome == routing::InsertOutcome::PENDING && result.eviction_candidate) {
      probe(*result.eviction_candidate, now);
    }
  }
}

void DiscoveryManager::Bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& seed : seeds) {
      if (std::find(seeds_.begin(), seeds_.end(), seed) == seeds_.end()) {
        seeds_.push_back(seed);
      }
    }
  }

  for (const auto& seed : seeds) {
    LOG_NET_INFO("bootstrapping from {}", util::FormatEndpoint(seed));
    find_nodes(seed, local_header_.sender.id);
  }
}

void DiscoveryManager::OnSendFailure(const asio::ip::udp::endpoint& to, TimePoint now) {
  const auto id = routing::ComputeNodeId(to);
  if (routing_table_.mark_unresponsive(id, now)) {
    LOG_NET_DEBUG("peer {} at {} unreachable", routing::ToHex(id), util::FormatEndpoint(to));
  }
}

void DiscoveryManager::expire_probes(TimePoint now) {
  std::vector<routing::NodeId> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = probes_.begin(); it != probes_.end();) {
      if (now >= it->second) {
        expired.push_back(it->first);
        it = probes_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto& id : expired) {
    probes_timed_out_.fetch_add(1, std::memory_order_relaxed);
    if (routing_table_.mark_unresponsive(id, now)) {
      LOG_NET_DEBUG("peer {} did not answer ping", routing::ToHex(id));
    }
  }
}

void DiscoveryManager::RunMaintenance(TimePoint now) {
  expire_probes(now);

  const size_t expired = routing_table_.remove_idle_nodes(now);
  if (expired > 0) {
    peers_expired_.fetch_add(expired, std::memory_order_relaxed);
    LOG_NET_DEBUG("removed {} silent peers", expired);
  }

  // One random peer per bucket, plus everyone halfway to expiry.
  const auto stale_after = bucket_config_.node_ttl / 2;
  for (const auto& bucket : routing_table_.buckets()) {
    for (const auto& peer : routing_table_.sample(bucket.height, 1)) {
      probe(peer, now);
    }
    for (const auto& peer : bucket.peers) {
      if (now - peer.last_seen >= stale_after) {
        probe(peer, now);
      }
    }
  }

  for (uint8_t height : routing_table_.idle_buckets(now)) {
    routing::NodeId target;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      target = routing::RandomIdAtHeight(local_header_.sender.id, height, rng_);
    }
    for (const auto& peer : routing_table_.sample(height, config_.alpha)) {
      find_nodes(peer.endpoint, target);
    }
  }

  if (routing_table_.empty()) {
    std::vector<asio::ip::udp::endpoint> seeds;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seeds = seeds_;
    }
    if (!seeds.empty()) {
      LOG_NET_INFO("routing table empty, asking {} seeds again", seeds.size());
      for (const auto& seed : seeds) {
        find_nodes(seed, local_header_.sender.id);
      }
    }
  }
}

size_t DiscoveryManager::pending_probes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return probes_.size();
}

DiscoveryManager::Stats DiscoveryManager::GetStats() const {
  Stats stats;
  stats.pings_sent = pings_sent_.load(std::memory_order_relaxed);
  stats.lookups_sent = lookups_sent_.load(std::memory_order_relaxed);
  stats.peers_learned = peers_learned_.load(std::memory_order_relaxed);
  stats.probes_timed_out = probes_timed_out_.load(std::memory_order_relaxed);
  stats.peers_expired = peers_expired_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace network
}  // namespace kadcast
