// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "routing/bucket.hpp"

#include <algorithm>
#include <iterator>

namespace kadcast {
namespace routing {

const char* InsertOutcomeName(InsertOutcome outcome) {
  switch (outcome) {
    case InsertOutcome::INVALID:
      return "invalid";
    case InsertOutcome::UPDATED:
      return "updated";
    case InsertOutcome::INSERTED:
      return "inserted";
    case InsertOutcome::PENDING:
      return "pending";
    case InsertOutcome::FULL:
      return "full";
  }
  return "unknown";
}

Bucket::Bucket(const BucketConfig& config) : config_(config), last_activity_(util::GetSteadyTime()) {}

bool Bucket::is_alive(const PeerInfo& peer, TimePoint now) const {
  return now - peer.last_seen < config_.node_ttl;
}

std::optional<PeerInfo> Bucket::flagged_for_eviction() const {
  if (!nodes_.empty() && nodes_.front().eviction_requested_at) {
    return nodes_.front();
  }
  return std::nullopt;
}

void Bucket::promote_pending(TimePoint now) {
  if (!pending_ || is_full()) {
    return;
  }
  if (is_alive(*pending_, now)) {
    nodes_.push_back(*pending_);
    last_activity_ = now;
  }
  pending_.reset();
}

void Bucket::try_perform_eviction(TimePoint now) {
  if (!is_full() || nodes_.empty()) {
    return;
  }
  PeerInfo& oldest = nodes_.front();
  if (oldest.eviction_requested_at) {
    if (now - *oldest.eviction_requested_at >= config_.node_evict_after) {
      nodes_.pop_front();
      promote_pending(now);
    }
  } else if (!is_alive(oldest, now)) {
    oldest.eviction_requested_at = now;
  }
}

bool Bucket::refresh(const NodeId& id, TimePoint now) {
  auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == id; });
  if (it == nodes_.end()) {
    return false;
  }
  PeerInfo peer = *it;
  nodes_.erase(it);
  peer.last_seen = now;
  peer.eviction_requested_at.reset();
  nodes_.push_back(peer);
  last_activity_ = now;
  return true;
}

InsertResult Bucket::insert(const BinaryId& binary, const asio::ip::udp::endpoint& endpoint, TimePoint now) {
  InsertResult result;

  auto existing = std::find_if(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == binary.id; });
  const bool known_nonce = existing != nodes_.end() && existing->binary.nonce == binary.nonce;
  if (!known_nonce && !VerifyNonce(binary.id, binary.nonce)) {
    result.outcome = InsertOutcome::INVALID;
    return result;
  }

  if (existing != nodes_.end()) {
    existing->binary = binary;
    existing->endpoint = endpoint;
    refresh(binary.id, now);
    try_perform_eviction(now);
    result.outcome = InsertOutcome::UPDATED;
    result.eviction_candidate = flagged_for_eviction();
    return result;
  }

  try_perform_eviction(now);

  if (!is_full()) {
    nodes_.push_back(PeerInfo{binary, endpoint, now, std::nullopt});
    last_activity_ = now;
    if (pending_ && pending_->id() == binary.id) {
      pending_.reset();
    }
    result.outcome = InsertOutcome::INSERTED;
    return result;
  }

  PeerInfo& oldest = nodes_.front();
  if (is_alive(oldest, now) && !oldest.eviction_requested_at) {
    result.outcome = InsertOutcome::FULL;
    return result;
  }

  if (!oldest.eviction_requested_at) {
    oldest.eviction_requested_at = now;
  }
  pending_ = PeerInfo{binary, endpoint, now, std::nullopt};
  result.outcome = InsertOutcome::PENDING;
  result.eviction_candidate = oldest;
  return result;
}

bool Bucket::remove(const NodeId& id) {
  auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == id; });
  if (it == nodes_.end()) {
    if (pending_ && pending_->id() == id) {
      pending_.reset();
      return true;
    }
    return false;
  }
  nodes_.erase(it);
  promote_pending(util::GetSteadyTime());
  return true;
}

bool Bucket::mark_unresponsive(const NodeId& id, TimePoint now) {
  auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == id; });
  if (it == nodes_.end()) {
    return false;
  }
  if (pending_ && is_alive(*pending_, now)) {
    nodes_.erase(it);
    promote_pending(now);
    return true;
  }
  if (!it->eviction_requested_at) {
    it->eviction_requested_at = now;
  }
  return false;
}

std::vector<PeerInfo> Bucket::pick(size_t count, std::mt19937_64& rng) const {
  std::vector<PeerInfo> out;
  const size_t n = std::min(count, nodes_.size());
  std::sample(nodes_.begin(), nodes_.end(), std::back_inserter(out), n, rng);
  return out;
}

std::vector<PeerInfo> Bucket::alive_nodes(TimePoint now) const {
  std::vector<PeerInfo> out;
  for (const auto& peer : nodes_) {
    if (is_alive(peer, now)) {
      out.push_back(peer);
    }
  }
  return out;
}

size_t Bucket::remove_idle_nodes(TimePoint now) {
  const size_t before = nodes_.size();
  try_perform_eviction(now);
  std::erase_if(nodes_, [&](const PeerInfo& p) { return !is_alive(p, now); });
  if (pending_ && !is_alive(*pending_, now)) {
    pending_.reset();
  }
  promote_pending(now);
  return before - std::min(before, nodes_.size());
}

bool Bucket::is_idle(TimePoint now) const {
  return now - last_activity_ >= config_.bucket_ttl;
}

bool Bucket::contains(const NodeId& id) const {
  return std::any_of(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == id; });
}

std::optional<PeerInfo> Bucket::find(const NodeId& id) const {
  auto it = std::find_if(nodes_.begin(), nodes_.end(), [&](const PeerInfo& p) { return p.id() == id; });
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace routing
}  // namespace kadcast
