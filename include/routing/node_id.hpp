// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace kadcast {
namespace routing {

using NodeId = std::array<uint8_t, protocol::ID_BYTES>;
using IdNonce = std::array<uint8_t, protocol::NONCE_BYTES>;

/**
 * BinaryId - a node identifier plus its proof-of-work nonce
 *
 * The identifier is derived from the node's public address:
 *   id = BLAKE2s(port as u16 LE || ip octets)[0..16]
 * so a peer cannot choose where it lands in somebody's routing table.
 * The nonce makes minting identities (one per port) cost a little work:
 * BLAKE2s(id || nonce) must start with ID_DIFFICULTY_BITS zero bits.
 */
struct BinaryId {
  NodeId id{};
  IdNonce nonce{};

  bool operator==(const BinaryId& other) const = default;
};

// Address octets in wire order: 4 bytes for IPv4 (including IPv4-mapped IPv6), 16 otherwise.
std::vector<uint8_t> AddressOctets(const asio::ip::address& address);

NodeId ComputeNodeId(const asio::ip::address& address, uint16_t port);
inline NodeId ComputeNodeId(const asio::ip::udp::endpoint& endpoint) {
  return ComputeNodeId(endpoint.address(), endpoint.port());
}

// Search for a nonce satisfying the difficulty. Expected 2^ID_DIFFICULTY_BITS hashes.
IdNonce MineNonce(const NodeId& id);
bool VerifyNonce(const NodeId& id, const IdNonce& nonce);

// Identity of a node reachable at `public_endpoint`.
BinaryId MakeBinaryId(const asio::ip::udp::endpoint& public_endpoint);

// Bit-wise XOR. Zero iff a == b.
NodeId XorDistance(const NodeId& a, const NodeId& b);

// Number of leading bits (MSB first) shared by a and b, i.e. the index of the
// bucket `b` belongs to in a's routing table. std::nullopt when a == b.
std::optional<uint8_t> HeightOf(const NodeId& a, const NodeId& b);

// True if distance(target, a) < distance(target, b), comparing big-endian.
bool CloserTo(const NodeId& target, const NodeId& a, const NodeId& b);

// Random identifier sharing exactly `height` leading bits with `local`.
// Used to refresh a bucket by looking up an id inside its range.
NodeId RandomIdAtHeight(const NodeId& local, uint8_t height, std::mt19937_64& rng);

std::string ToHex(const NodeId& id);

struct NodeIdHasher {
  size_t operator()(const NodeId& id) const noexcept {
    // Identifiers are hash outputs already.
    size_t h = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i) {
      h = (h << 8) | id[i];
    }
    return h;
  }
};

}  // namespace routing
}  // namespace kadcast
