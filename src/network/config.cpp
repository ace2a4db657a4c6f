// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/config.hpp"

#include "util/netaddress.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace kadcast {
namespace network {

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument("invalid configuration: " + message);
  }
}

asio::ip::udp::endpoint EndpointFromJson(const nlohmann::json& value, const std::string& key) {
  if (!value.is_string()) {
    throw std::invalid_argument("invalid configuration: " + key + " must be an \"ip:port\" string");
  }
  auto endpoint = util::ParseEndpoint(value.get<std::string>());
  if (!endpoint) {
    throw std::invalid_argument("invalid configuration: cannot parse " + key + " '" + value.get<std::string>() + "'");
  }
  return *endpoint;
}

template <typename T>
void ReadValue(const nlohmann::json& object, const char* key, T& out) {
  if (object.contains(key)) {
    out = object.at(key).get<T>();
  }
}

void ReadMillis(const nlohmann::json& object, const char* key, std::chrono::milliseconds& out) {
  if (object.contains(key)) {
    out = std::chrono::milliseconds(object.at(key).get<int64_t>());
  }
}

}  // namespace

void NodeConfig::Validate() const {
  Require(public_address.port() != 0, "public_address needs a port");
  Require(!public_address.address().is_unspecified(), "public_address must be a routable address, not "
                                                      "0.0.0.0 or ::");
  Require(sweep_interval.count() > 0, "sweep_interval must be positive");

  Require(bucket.k > 0, "bucket.k must be at least 1");
  Require(bucket.node_ttl.count() > 0, "bucket.node_ttl must be positive");
  Require(bucket.node_evict_after.count() > 0, "bucket.node_evict_after must be positive");
  Require(bucket.bucket_ttl.count() > 0, "bucket.bucket_ttl must be positive");

  Require(codec.mtu <= protocol::MAX_DATAGRAM_SIZE, "codec.mtu exceeds the largest UDP payload");
  Require(transport::SymbolSizeForMtu(codec.mtu) >= protocol::MIN_SYMBOL_SIZE,
          "codec.mtu too small to carry one symbol (minimum " +
              std::to_string(protocol::BROADCAST_OVERHEAD + protocol::MIN_SYMBOL_SIZE) + ")");
  Require(std::isfinite(codec.fec_redundancy) && codec.fec_redundancy >= 0.0,
          "codec.fec_redundancy must be a non-negative number");
  Require(codec.max_payload_size <= UINT32_MAX, "codec.max_payload_size exceeds 4 GiB");
  Require(transport::ComputeLayout(static_cast<uint32_t>(codec.max_payload_size),
                                   static_cast<uint16_t>(transport::SymbolSizeForMtu(codec.mtu)))
              .has_value(),
          "codec.max_payload_size needs more source blocks than the wire format allows");
  Require(codec.reassembly_timeout.count() > 0, "codec.reassembly_timeout must be positive");
  Require(codec.max_pending_messages > 0, "codec.max_pending_messages must be at least 1");
  Require(codec.max_pending_bytes / protocol::REASSEMBLY_SHARDS >= 2 * codec.max_payload_size,
          "codec.max_pending_bytes must hold two of the largest messages per reassembly shard (minimum " +
              std::to_string(protocol::REASSEMBLY_SHARDS * 2 * codec.max_payload_size) + ")");

  Require(discovery.alpha > 0, "discovery.alpha must be at least 1");
  Require(discovery.ping_interval.count() > 0, "discovery.ping_interval must be positive");
  Require(discovery.ping_timeout.count() > 0, "discovery.ping_timeout must be positive");
  Require(discovery.ping_interval < bucket.node_ttl,
          "discovery.ping_interval must be shorter than bucket.node_ttl or live peers expire");

  Require(diffusion.beta > 0, "diffusion.beta must be at least 1");
  Require(diffusion.seen_cache_ttl.count() > 0, "diffusion.seen_cache_ttl must be positive");
  Require(diffusion.max_seen_entries > 0, "diffusion.max_seen_entries must be at least 1");
}

NodeConfig NodeConfigFromJson(const nlohmann::json& json, NodeConfig base) {
  if (!json.is_object()) {
    throw std::invalid_argument("invalid configuration: top level must be a JSON object");
  }

  NodeConfig config = std::move(base);
  try {
    if (json.contains("public_address")) {
      config.public_address = EndpointFromJson(json.at("public_address"), "public_address");
    }
    if (json.contains("listen_address")) {
      config.listen_address = EndpointFromJson(json.at("listen_address"), "listen_address");
    }
    if (json.contains("bootstrap")) {
      Require(json.at("bootstrap").is_array(), "bootstrap must be an array of \"ip:port\" strings");
      config.bootstrap_nodes.clear();
      for (const auto& entry : json.at("bootstrap")) {
        config.bootstrap_nodes.push_back(EndpointFromJson(entry, "bootstrap"));
      }
    }
    ReadValue(json, "io_threads", config.io_threads);
    ReadMillis(json, "sweep_interval_ms", config.sweep_interval);

    if (json.contains("bucket")) {
      const auto& b = json.at("bucket");
      ReadValue(b, "k", config.bucket.k);
      ReadMillis(b, "node_ttl_ms", config.bucket.node_ttl);
      ReadMillis(b, "node_evict_after_ms", config.bucket.node_evict_after);
      ReadMillis(b, "bucket_ttl_ms", config.bucket.bucket_ttl);
    }

    if (json.contains("codec")) {
      const auto& c = json.at("codec");
      ReadValue(c, "mtu", config.codec.mtu);
      ReadValue(c, "fec_redundancy", config.codec.fec_redundancy);
      ReadValue(c, "min_repair_per_block", config.codec.min_repair_per_block);
      ReadValue(c, "max_payload_size", config.codec.max_payload_size);
      ReadMillis(c, "reassembly_timeout_ms", config.codec.reassembly_timeout);
      ReadValue(c, "max_pending_messages", config.codec.max_pending_messages);
      ReadValue(c, "max_pending_bytes", config.codec.max_pending_bytes);
    }

    if (json.contains("transport")) {
      const auto& t = json.at("transport");
      ReadValue(t, "send_retry_count", config.transport.send_retry_count);
      ReadMillis(t, "send_retry_interval_ms", config.transport.send_retry_interval);
      if (t.contains("recv_buffer_size")) {
        config.transport.recv_buffer_size = t.at("recv_buffer_size").get<size_t>();
      }
      if (t.contains("send_buffer_size")) {
        config.transport.send_buffer_size = t.at("send_buffer_size").get<size_t>();
      }
    }

    if (json.contains("discovery")) {
      const auto& d = json.at("discovery");
      ReadValue(d, "alpha", config.discovery.alpha);
      ReadMillis(d, "ping_interval_ms", config.discovery.ping_interval);
      ReadMillis(d, "ping_timeout_ms", config.discovery.ping_timeout);
      ReadValue(d, "recursive_discovery", config.discovery.recursive_discovery);
    }

    if (json.contains("diffusion")) {
      const auto& d = json.at("diffusion");
      ReadValue(d, "beta", config.diffusion.beta);
      ReadValue(d, "auto_propagate", config.diffusion.auto_propagate);
      ReadMillis(d, "seen_cache_ttl_ms", config.diffusion.seen_cache_ttl);
      ReadValue(d, "max_seen_entries", config.diffusion.max_seen_entries);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("invalid configuration: ") + e.what());
  }
  return config;
}

nlohmann::json NodeConfigToJson(const NodeConfig& config) {
  nlohmann::json bootstrap = nlohmann::json::array();
  for (const auto& endpoint : config.bootstrap_nodes) {
    bootstrap.push_back(util::FormatEndpoint(endpoint));
  }

  nlohmann::json transport = {
      {"send_retry_count", config.transport.send_retry_count},
      {"send_retry_interval_ms", config.transport.send_retry_interval.count()},
  };
  if (config.transport.recv_buffer_size) {
    transport["recv_buffer_size"] = *config.transport.recv_buffer_size;
  }
  if (config.transport.send_buffer_size) {
    transport["send_buffer_size"] = *config.transport.send_buffer_size;
  }

  nlohmann::json out = {
      {"public_address", util::FormatEndpoint(config.public_address)},
      {"bootstrap", std::move(bootstrap)},
      {"io_threads", config.io_threads},
      {"sweep_interval_ms", config.sweep_interval.count()},
      {"bucket",
       {
           {"k", config.bucket.k},
           {"node_ttl_ms", config.bucket.node_ttl.count()},
           {"node_evict_after_ms", config.bucket.node_evict_after.count()},
           {"bucket_ttl_ms", config.bucket.bucket_ttl.count()},
       }},
      {"codec",
       {
           {"mtu", config.codec.mtu},
           {"fec_redundancy", config.codec.fec_redundancy},
           {"min_repair_per_block", config.codec.min_repair_per_block},
           {"max_payload_size", config.codec.max_payload_size},
           {"reassembly_timeout_ms", config.codec.reassembly_timeout.count()},
           {"max_pending_messages", config.codec.max_pending_messages},
           {"max_pending_bytes", config.codec.max_pending_bytes},
       }},
      {"transport", std::move(transport)},
      {"discovery",
       {
           {"alpha", config.discovery.alpha},
           {"ping_interval_ms", config.discovery.ping_interval.count()},
           {"ping_timeout_ms", config.discovery.ping_timeout.count()},
           {"recursive_discovery", config.discovery.recursive_discovery},
       }},
      {"diffusion",
       {
           {"beta", config.diffusion.beta},
           {"auto_propagate", config.diffusion.auto_propagate},
           {"seen_cache_ttl_ms", config.diffusion.seen_cache_ttl.count()},
           {"max_seen_entries", config.diffusion.max_seen_entries},
       }},
  };
  if (config.listen_address) {
    out["listen_address"] = util::FormatEndpoint(*config.listen_address);
  }
  return out;
}

NodeConfig LoadNodeConfig(const std::string& path, NodeConfig base) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("cannot open config file " + path);
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
  }
  return NodeConfigFromJson(json, std::move(base));
}

}  // namespace network
}  // namespace kadcast
