// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "routing/node_id.hpp"
#include "util/time.hpp"

#include <chrono>
#include <deque>
#include <optional>
#include <random>
#include <vector>

#include <asio/ip/udp.hpp>

namespace kadcast {
namespace routing {

struct PeerInfo {
  BinaryId binary;
  asio::ip::udp::endpoint endpoint;
  std::chrono::steady_clock::time_point last_seen{};
  // Set while the peer is the least-recently-seen entry of a full bucket
  // and a replacement is waiting on its liveness probe.
  std::optional<std::chrono::steady_clock::time_point> eviction_requested_at;

  const NodeId& id() const { return binary.id; }
};

struct BucketConfig {
  size_t k = protocol::DEFAULT_K;
  std::chrono::milliseconds node_ttl = protocol::DEFAULT_NODE_TTL;
  std::chrono::milliseconds node_evict_after = protocol::DEFAULT_NODE_EVICT_AFTER;
  std::chrono::milliseconds bucket_ttl = protocol::DEFAULT_BUCKET_TTL;
};

enum class InsertOutcome {
  INVALID,   // identity nonce failed verification
  UPDATED,   // already known; refreshed and moved to the tail
  INSERTED,  // appended to a non-full bucket
  PENDING,   // parked as replacement; oldest entry flagged for a probe
  FULL,      // oldest entry is alive; candidate discarded
};

const char* InsertOutcomeName(InsertOutcome outcome);

struct InsertResult {
  InsertOutcome outcome{InsertOutcome::INVALID};
  // The entry that should be pinged to decide a pending eviction.
  std::optional<PeerInfo> eviction_candidate;
};

/**
 * Bucket - one k-bucket of the routing table
 *
 * Entries are ordered least-recently-seen first. Invariants: size() <= k,
 * no duplicate NodeId. At most one pending node waits for a slot.
 *
 * A full bucket prefers its existing members: a newcomer only gets in once
 * the oldest member has been silent for node_ttl and then stayed silent for
 * node_evict_after after being flagged.
 *
 * Not thread-safe; RoutingTable serializes access.
 */
class Bucket {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit Bucket(const BucketConfig& config = {});

  InsertResult insert(const BinaryId& binary, const asio::ip::udp::endpoint& endpoint,
                      TimePoint now = util::GetSteadyTime());

  // Refresh last_seen of a known peer and move it to the tail. Clears any eviction flag.
  bool refresh(const NodeId& id, TimePoint now = util::GetSteadyTime());

  bool remove(const NodeId& id);

  // A liveness probe for `id` timed out. If a replacement is pending the peer
  // is dropped right away and the replacement promoted.
  bool mark_unresponsive(const NodeId& id, TimePoint now = util::GetSteadyTime());

  // Uniform random sample of up to `count` entries, without replacement.
  std::vector<PeerInfo> pick(size_t count, std::mt19937_64& rng) const;

  std::vector<PeerInfo> peers() const { return {nodes_.begin(), nodes_.end()}; }
  std::vector<PeerInfo> alive_nodes(TimePoint now = util::GetSteadyTime()) const;

  // Completes an expired pending eviction, then drops entries not seen
  // within node_ttl. Returns how many entries were removed.
  size_t remove_idle_nodes(TimePoint now = util::GetSteadyTime());

  // No insert or refresh for bucket_ttl.
  bool is_idle(TimePoint now = util::GetSteadyTime()) const;

  bool contains(const NodeId& id) const;
  std::optional<PeerInfo> find(const NodeId& id) const;

  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  bool is_full() const { return nodes_.size() >= config_.k; }
  const std::optional<PeerInfo>& pending() const { return pending_; }
  TimePoint last_activity() const { return last_activity_; }

private:
  bool is_alive(const PeerInfo& peer, TimePoint now) const;
  std::optional<PeerInfo> flagged_for_eviction() const;
  void try_perform_eviction(TimePoint now);
  void promote_pending(TimePoint now);

  BucketConfig config_;
  std::deque<PeerInfo> nodes_;
  std::optional<PeerInfo> pending_;
  TimePoint last_activity_;
};

}  // namespace routing
}  // namespace kadcast
