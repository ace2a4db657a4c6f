// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "routing/bucket.hpp"
#include "routing/node_id.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace kadcast {
namespace routing {

/**
 * RoutingTable - ID_BITS buckets indexed by height (common prefix length
 * with the local id).
 *
 * Bucket h holds peers that share exactly h leading bits with us, so the
 * whole id space is partitioned into disjoint subtrees and bucket h covers
 * half of what remains above it. Diffusion relies on that partition.
 *
 * Thread-safety: one table-wide mutex. Every public method takes it for its
 * full duration and returns copies, so callers never see a half-applied insert.
 */
class RoutingTable {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct BucketSample {
    uint8_t height{0};
    std::vector<PeerInfo> peers;
  };

  RoutingTable(const BinaryId& local, const BucketConfig& config = {});
  RoutingTable(const BinaryId& local, const BucketConfig& config, uint64_t seed);

  RoutingTable(const RoutingTable&) = delete;
  RoutingTable& operator=(const RoutingTable&) = delete;

  const BinaryId& local() const { return local_; }

  std::optional<uint8_t> height_of(const NodeId& peer_id) const;

  // Insert a peer or refresh it. Inserting ourselves yields INVALID.
  InsertResult insert_or_refresh(const BinaryId& binary, const asio::ip::udp::endpoint& endpoint,
                                 TimePoint now = util::GetSteadyTime());

  bool refresh(const NodeId& id, TimePoint now = util::GetSteadyTime());
  bool has_peer(const NodeId& id) const;
  std::optional<PeerInfo> find_peer(const NodeId& id) const;
  bool remove_peer(const NodeId& id);
  bool mark_unresponsive(const NodeId& id, TimePoint now = util::GetSteadyTime());

  // Every peer in buckets with index >= h.
  std::vector<PeerInfo> peers_at_or_above(uint8_t h) const;

  // Up to `count` random peers from one bucket.
  std::vector<PeerInfo> sample(uint8_t bucket, size_t count);

  // Up to `beta` random peers from each non-empty bucket with index >= h.
  std::vector<BucketSample> sample_at_or_above(uint8_t h, size_t beta);

  // Up to `count` peers ordered by XOR distance to `target`.
  std::vector<PeerInfo> closest_peers(const NodeId& target, size_t count,
                                      const std::optional<NodeId>& exclude = std::nullopt) const;

  // Non-empty buckets without activity for bucket_ttl.
  std::vector<uint8_t> idle_buckets(TimePoint now = util::GetSteadyTime()) const;

  size_t remove_idle_nodes(TimePoint now = util::GetSteadyTime());

  // Snapshot of non-empty buckets.
  std::vector<BucketSample> buckets() const;

  size_t size() const;
  bool empty() const { return size() == 0; }

  nlohmann::json report() const;

private:
  BinaryId local_;
  mutable std::mutex mutex_;
  std::vector<Bucket> buckets_;
  std::mt19937_64 rng_;
};

}  // namespace routing
}  // namespace kadcast
