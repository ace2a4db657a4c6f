// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "routing/routing_table.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>

namespace kadcast {
namespace routing {

RoutingTable::RoutingTable(const BinaryId& local, const BucketConfig& config)
    : RoutingTable(local, config, std::random_device{}()) {}

RoutingTable::RoutingTable(const BinaryId& local, const BucketConfig& config, uint64_t seed)
    : local_(local), buckets_(protocol::ID_BITS, Bucket(config)), rng_(seed) {}

std::optional<uint8_t> RoutingTable::height_of(const NodeId& peer_id) const {
  return HeightOf(local_.id, peer_id);
}

InsertResult RoutingTable::insert_or_refresh(const BinaryId& binary, const asio::ip::udp::endpoint& endpoint,
                                             TimePoint now) {
  auto height = HeightOf(local_.id, binary.id);
  if (!height) {
    return InsertResult{InsertOutcome::INVALID, std::nullopt};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto result = buckets_[*height].insert(binary, endpoint, now);
  switch (result.outcome) {
    case InsertOutcome::INSERTED:
      LOG_ROUTING_DEBUG("peer {} ({}) inserted at height {}", ToHex(binary.id), util::FormatEndpoint(endpoint),
                        *height);
      break;
    case InsertOutcome::PENDING:
      LOG_ROUTING_DEBUG("bucket {} full, {} pending on probe of {}", *height, ToHex(binary.id),
                        ToHex(result.eviction_candidate->id()));
      break;
    case InsertOutcome::FULL:
      LOG_ROUTING_TRACE("bucket {} full, {} discarded", *height, ToHex(binary.id));
      break;
    default:
      break;
  }
  return result;
}

bool RoutingTable::refresh(const NodeId& id, TimePoint now) {
  auto height = HeightOf(local_.id, id);
  if (!height) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_[*height].refresh(id, now);
}

bool RoutingTable::has_peer(const NodeId& id) const {
  auto height = HeightOf(local_.id, id);
  if (!height) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_[*height].contains(id);
}

std::optional<PeerInfo> RoutingTable::find_peer(const NodeId& id) const {
  auto height = HeightOf(local_.id, id);
  if (!height) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_[*height].find(id);
}

bool RoutingTable::remove_peer(const NodeId& id) {
  auto height = HeightOf(local_.id, id);
  if (!height) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_[*height].remove(id);
}

bool RoutingTable::mark_unresponsive(const NodeId& id, TimePoint now) {
  auto height = HeightOf(local_.id, id);
  if (!height) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const bool replaced = buckets_[*height].mark_unresponsive(id, now);
  if (replaced) {
    LOG_ROUTING_DEBUG("unresponsive peer {} replaced in bucket {}", ToHex(id), *height);
  }
  return replaced;
}

std::vector<PeerInfo> RoutingTable::peers_at_or_above(uint8_t h) const {
  std::vector<PeerInfo> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = h; i < buckets_.size(); ++i) {
    auto peers = buckets_[i].peers();
    out.insert(out.end(), peers.begin(), peers.end());
  }
  return out;
}

std::vector<PeerInfo> RoutingTable::sample(uint8_t bucket, size_t count) {
  if (bucket >= buckets_.size()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_[bucket].pick(count, rng_);
}

std::vector<RoutingTable::BucketSample> RoutingTable::sample_at_or_above(uint8_t h, size_t beta) {
  std::vector<BucketSample> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = h; i < buckets_.size(); ++i) {
    if (buckets_[i].empty()) {
      continue;
    }
    out.push_back(BucketSample{static_cast<uint8_t>(i), buckets_[i].pick(beta, rng_)});
  }
  return out;
}

std::vector<PeerInfo> RoutingTable::closest_peers(const NodeId& target, size_t count,
                                                  const std::optional<NodeId>& exclude) const {
  std::vector<PeerInfo> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& bucket : buckets_) {
      for (auto& peer : bucket.peers()) {
        if (exclude && peer.id() == *exclude) {
          continue;
        }
        all.push_back(std::move(peer));
      }
    }
  }

  const size_t n = std::min(count, all.size());
  std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(n), all.end(),
                    [&](const PeerInfo& a, const PeerInfo& b) { return CloserTo(target, a.id(), b.id()); });
  all.resize(n);
  return all;
}

std::vector<uint8_t> RoutingTable::idle_buckets(TimePoint now) const {
  std::vector<uint8_t> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < buckets_.size(); ++i) {
    if (!buckets_[i].empty() && buckets_[i].is_idle(now)) {
      out.push_back(static_cast<uint8_t>(i));
    }
  }
  return out;
}

size_t RoutingTable::remove_idle_nodes(TimePoint now) {
  size_t removed = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& bucket : buckets_) {
    removed += bucket.remove_idle_nodes(now);
  }
  if (removed > 0) {
    LOG_ROUTING_DEBUG("removed {} idle peers", removed);
  }
  return removed;
}

std::vector<RoutingTable::BucketSample> RoutingTable::buckets() const {
  std::vector<BucketSample> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < buckets_.size(); ++i) {
    if (!buckets_[i].empty()) {
      out.push_back(BucketSample{static_cast<uint8_t>(i), buckets_[i].peers()});
    }
  }
  return out;
}

size_t RoutingTable::size() const {
  size_t total = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& bucket : buckets_) {
    total += bucket.size();
  }
  return total;
}

nlohmann::json RoutingTable::report() const {
  const auto now = util::GetSteadyTime();
  nlohmann::json buckets = nlohmann::json::array();
  size_t total = 0;

  for (const auto& [height, peers] : this->buckets()) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& peer : peers) {
      entries.push_back({
          {"id", ToHex(peer.id())},
          {"address", util::FormatEndpoint(peer.endpoint)},
          {"last_seen_ms", std::chrono::duration_cast<std::chrono::milliseconds>(now - peer.last_seen).count()},
          {"eviction_requested", peer.eviction_requested_at.has_value()},
      });
    }
    total += peers.size();
    buckets.push_back({{"height", height}, {"size", peers.size()}, {"peers", std::move(entries)}});
  }

  return {
      {"local_id", ToHex(local_.id)},
      {"total_peers", total},
      {"buckets", std::move(buckets)},
  };
}

}  // namespace routing
}  // namespace kadcast
