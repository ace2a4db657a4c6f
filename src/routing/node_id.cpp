// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "routing/node_id.hpp"

#include "util/blake2s.hpp"
#include "util/netaddress.hpp"

#include <bit>
#include <stdexcept>

namespace kadcast {
namespace routing {

namespace {

// Count leading zero bits of a byte string, MSB first.
unsigned LeadingZeroBits(const uint8_t* data, size_t len) {
  unsigned bits = 0;
  for (size_t i = 0; i < len; ++i) {
    if (data[i] == 0) {
      bits += 8;
      continue;
    }
    bits += static_cast<unsigned>(std::countl_zero(data[i]));
    break;
  }
  return bits;
}

}  // namespace

std::vector<uint8_t> AddressOctets(const asio::ip::address& address) {
  const auto normalized = util::NormalizeAddress(address);
  if (normalized.is_v4()) {
    const auto bytes = normalized.to_v4().to_bytes();
    return {bytes.begin(), bytes.end()};
  }
  const auto bytes = normalized.to_v6().to_bytes();
  return {bytes.begin(), bytes.end()};
}

NodeId ComputeNodeId(const asio::ip::address& address, uint16_t port) {
  util::Blake2sHasher hasher;
  const uint8_t port_le[2] = {static_cast<uint8_t>(port & 0xFF), static_cast<uint8_t>(port >> 8)};
  hasher.Write(port_le, sizeof(port_le));
  const auto octets = AddressOctets(address);
  hasher.Write(octets.data(), octets.size());

  uint8_t digest[util::Blake2sHasher::MAX_OUTPUT_SIZE];
  hasher.Finalize(digest);

  NodeId id{};
  std::copy(digest, digest + id.size(), id.begin());
  return id;
}

bool VerifyNonce(const NodeId& id, const IdNonce& nonce) {
  util::Blake2sHasher hasher;
  hasher.Write(id.data(), id.size()).Write(nonce.data(), nonce.size());
  uint8_t digest[util::Blake2sHasher::MAX_OUTPUT_SIZE];
  hasher.Finalize(digest);
  return LeadingZeroBits(digest, sizeof(digest)) >= protocol::ID_DIFFICULTY_BITS;
}

IdNonce MineNonce(const NodeId& id) {
  // The id prefix is shared by every attempt.
  util::Blake2sHasher prefix;
  prefix.Write(id.data(), id.size());

  for (uint64_t counter = 0; counter <= UINT32_MAX; ++counter) {
    const IdNonce nonce = {static_cast<uint8_t>(counter), static_cast<uint8_t>(counter >> 8),
                           static_cast<uint8_t>(counter >> 16), static_cast<uint8_t>(counter >> 24)};
    util::Blake2sHasher attempt(prefix);
    attempt.Write(nonce.data(), nonce.size());
    uint8_t digest[util::Blake2sHasher::MAX_OUTPUT_SIZE];
    attempt.Finalize(digest);
    if (LeadingZeroBits(digest, sizeof(digest)) >= protocol::ID_DIFFICULTY_BITS) {
      return nonce;
    }
  }
  throw std::runtime_error("no identity nonce found for node id " + ToHex(id));
}

BinaryId MakeBinaryId(const asio::ip::udp::endpoint& public_endpoint) {
  BinaryId binary;
  binary.id = ComputeNodeId(public_endpoint);
  binary.nonce = MineNonce(binary.id);
  return binary;
}

NodeId XorDistance(const NodeId& a, const NodeId& b) {
  NodeId out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = a[i] ^ b[i];
  }
  return out;
}

std::optional<uint8_t> HeightOf(const NodeId& a, const NodeId& b) {
  const NodeId distance = XorDistance(a, b);
  const unsigned shared = LeadingZeroBits(distance.data(), distance.size());
  if (shared >= protocol::ID_BITS) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(shared);
}

bool CloserTo(const NodeId& target, const NodeId& a, const NodeId& b) {
  for (size_t i = 0; i < target.size(); ++i) {
    const uint8_t da = target[i] ^ a[i];
    const uint8_t db = target[i] ^ b[i];
    if (da != db) {
      return da < db;
    }
  }
  return false;
}

NodeId RandomIdAtHeight(const NodeId& local, uint8_t height, std::mt19937_64& rng) {
  NodeId out{};
  std::uniform_int_distribution<int> byte_dist(0, 255);
  for (auto& b : out) {
    b = static_cast<uint8_t>(byte_dist(rng));
  }

  // Copy the first `height` bits, flip bit `height`, keep the rest random.
  const size_t full_bytes = height / 8;
  for (size_t i = 0; i < full_bytes; ++i) {
    out[i] = local[i];
  }
  const unsigned bit_in_byte = height % 8;
  const uint8_t flip = static_cast<uint8_t>(0x80u >> bit_in_byte);
  const uint8_t keep_mask = static_cast<uint8_t>(0xFF00u >> bit_in_byte);
  uint8_t& pivot = out[full_bytes];
  pivot = static_cast<uint8_t>((local[full_bytes] & keep_mask) | (pivot & ~keep_mask & 0xFF));
  pivot = static_cast<uint8_t>((pivot & ~flip) | (~local[full_bytes] & flip));
  return out;
}

std::string ToHex(const NodeId& id) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(id.size() * 2);
  for (uint8_t b : id) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

}  // namespace routing
}  // namespace kadcast
