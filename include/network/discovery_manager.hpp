// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/config.hpp"
#include "network/message.hpp"
#include "routing/routing_table.hpp"
#include "transport/transport.hpp"
#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

namespace kadcast {
namespace network {

/**
 * DiscoveryManager - keeps the routing table populated and alive
 *
 * Responsibilities:
 * - Insert or refresh the sender of every verified message
 * - Answer Ping with Pong and FindNodes with the closest known peers
 * - Learn peers from Nodes responses (pinging them with recursive_discovery)
 * - Bootstrap from seed addresses whose ids we do not know yet
 * - Periodic maintenance: liveness probes, lookups for idle buckets,
 *   removal of dead entries, re-bootstrap while the table is empty
 *
 * A probe is a Ping with a deadline. Any message from the probed peer clears
 * it; a missed deadline marks the peer unresponsive in its bucket.
 *
 * Thread-safety: all methods may be called concurrently from io threads.
 */
class DiscoveryManager {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct Stats {
    uint64_t pings_sent{0};
    uint64_t lookups_sent{0};
    uint64_t peers_learned{0};
    uint64_t probes_timed_out{0};
    uint64_t peers_expired{0};
  };

  DiscoveryManager(const message::Header& local_header, routing::RoutingTable& routing_table,
                   transport::DatagramTransport& transport, const DiscoveryConfig& config,
                   const routing::BucketConfig& bucket_config);

  DiscoveryManager(const DiscoveryManager&) = delete;
  DiscoveryManager& operator=(const DiscoveryManager&) = delete;

  // Called for every message whose header passed the address check. `from`
  // is the sender's advertised endpoint. Returns false if the identity nonce
  // is invalid, in which case the message must be dropped.
  bool OnMessage(const message::Header& header, const asio::ip::udp::endpoint& from,
                 TimePoint now = util::GetSteadyTime());

  void HandlePing(const asio::ip::udp::endpoint& from);
  void HandleFindNodes(const message::Header& header, const message::FindNodesMessage& msg,
                       const asio::ip::udp::endpoint& from);
  void HandleNodes(const message::NodesMessage& msg, TimePoint now = util::GetSteadyTime());

  // Ask every seed for the peers closest to our own id. Seeds are remembered
  // and asked again whenever the table runs empty.
  void Bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds);

  void RunMaintenance(TimePoint now = util::GetSteadyTime());

  // The transport gave up on a datagram to `to`.
  void OnSendFailure(const asio::ip::udp::endpoint& to, TimePoint now = util::GetSteadyTime());

  size_t pending_probes() const;
  Stats GetStats() const;

private:
  void send(const asio::ip::udp::endpoint& to, message::Payload payload);
  void probe(const routing::PeerInfo& peer, TimePoint now);
  void find_nodes(const asio::ip::udp::endpoint& to, const routing::NodeId& target);
  void expire_probes(TimePoint now);

  message::Header local_header_;
  routing::RoutingTable& routing_table_;
  transport::DatagramTransport& transport_;
  DiscoveryConfig config_;
  routing::BucketConfig bucket_config_;

  mutable std::mutex mutex_;
  std::vector<asio::ip::udp::endpoint> seeds_;
  std::unordered_map<routing::NodeId, TimePoint, routing::NodeIdHasher> probes_;  // id -> deadline
  std::mt19937_64 rng_;

  std::atomic<uint64_t> pings_sent_{0};
  std::atomic<uint64_t> lookups_sent_{0};
  std::atomic<uint64_t> peers_learned_{0};
  std::atomic<uint64_t> probes_timed_out_{0};
  std::atomic<uint64_t> peers_expired_{0};
};

}  // namespace network
}  // namespace kadcast
