// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "routing/bucket.hpp"
#include "transport/chunk_codec.hpp"
#include "transport/udp_transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/udp.hpp>
#include <nlohmann/json.hpp>

namespace kadcast {
namespace network {

struct DiscoveryConfig {
  size_t alpha = protocol::DEFAULT_ALPHA;
  std::chrono::milliseconds ping_interval = protocol::DEFAULT_PING_INTERVAL;
  std::chrono::milliseconds ping_timeout = protocol::DEFAULT_PING_TIMEOUT;
  // Ping unknown peers learned from Nodes responses so they learn about us.
  bool recursive_discovery = true;
};

struct DiffusionConfig {
  size_t beta = protocol::DEFAULT_BETA;
  // Forward every received broadcast automatically. When off the application
  // decides per message through KadcastNode::propagate().
  bool auto_propagate = true;
  std::chrono::milliseconds seen_cache_ttl = protocol::DEFAULT_SEEN_CACHE_TTL;
  size_t max_seen_entries = protocol::DEFAULT_MAX_SEEN_ENTRIES;
};

/**
 * NodeConfig - everything a KadcastNode needs
 *
 * public_address is what other nodes use to reach us and what our identity
 * is derived from. listen_address defaults to it; set it to bind a local
 * interface behind a port forward.
 */
struct NodeConfig {
  asio::ip::udp::endpoint public_address{asio::ip::make_address("127.0.0.1"), protocol::DEFAULT_PORT};
  std::optional<asio::ip::udp::endpoint> listen_address;
  std::vector<asio::ip::udp::endpoint> bootstrap_nodes;

  size_t io_threads = protocol::DEFAULT_IO_THREADS;  // 0 = caller drives the io_context
  std::chrono::milliseconds sweep_interval = protocol::DEFAULT_SWEEP_INTERVAL;

  routing::BucketConfig bucket;
  transport::CodecConfig codec;
  transport::TransportConfig transport;
  DiscoveryConfig discovery;
  DiffusionConfig diffusion;

  asio::ip::udp::endpoint effective_listen_address() const { return listen_address.value_or(public_address); }

  // Throws std::invalid_argument describing the first inconsistent value.
  void Validate() const;
};

// Missing keys keep their defaults; durations are in milliseconds.
// Throws std::invalid_argument on wrongly typed or unparsable values.
NodeConfig NodeConfigFromJson(const nlohmann::json& json, NodeConfig base = {});

nlohmann::json NodeConfigToJson(const NodeConfig& config);

// Throws std::runtime_error if the file cannot be read or parsed.
NodeConfig LoadNodeConfig(const std::string& path, NodeConfig base = {});

}  // namespace network
}  // namespace kadcast
