// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "util/time.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kadcast {
namespace transport {

using MessageId = std::array<uint8_t, protocol::MESSAGE_ID_BYTES>;

// Keys below are chosen by remote peers, so bucket placement is keyed with a
// per-process random salt.
struct MessageIdHasher {
  size_t operator()(const MessageId& id) const noexcept;
};

// First 8 bytes in hex, for log lines.
std::string ShortHex(const MessageId& id);

/**
 * Chunk - one erasure-coded symbol of a broadcast payload
 *
 * Every chunk carries the full encoding parameters, so a receiver can start
 * reassembly from whichever chunk arrives first.
 */
struct Chunk {
  MessageId message_id{};
  uint32_t transfer_length{0};
  uint16_t symbol_size{0};
  uint16_t block_count{0};
  uint16_t block_index{0};
  uint16_t block_source_symbols{0};
  uint16_t symbol_index{0};
  std::vector<uint8_t> symbol;
};

struct CodecConfig {
  size_t mtu = protocol::DEFAULT_MTU;  // largest broadcast datagram, headers included
  double fec_redundancy = protocol::DEFAULT_FEC_REDUNDANCY;
  size_t min_repair_per_block = protocol::DEFAULT_MIN_REPAIR_PER_BLOCK;
  size_t max_payload_size = protocol::DEFAULT_MAX_PAYLOAD_SIZE;
  std::chrono::milliseconds reassembly_timeout = protocol::DEFAULT_REASSEMBLY_TIMEOUT;
  size_t max_pending_messages = protocol::DEFAULT_MAX_PENDING_MESSAGES;
  size_t max_pending_bytes = protocol::DEFAULT_MAX_PENDING_BYTES;
};

// Symbol bytes that fit in one datagram of `mtu` bytes. 0 if the MTU is too small.
size_t SymbolSizeForMtu(size_t mtu);

// Repair symbols sent for a block of k source symbols.
size_t RepairSymbolsFor(size_t k, const CodecConfig& config);

// Split of a transfer into source blocks. A pure function of
// (transfer_length, symbol_size), recomputed by the receiver to validate chunks.
struct BlockLayout {
  size_t first_symbol{0};  // index of the block's first source symbol in the transfer
  size_t source_symbols{0};
};

std::optional<std::vector<BlockLayout>> ComputeLayout(uint32_t transfer_length, uint16_t symbol_size);

class ChunkEncoder {
public:
  explicit ChunkEncoder(const CodecConfig& config);

  // All source and repair chunks of `payload`. std::nullopt if the payload
  // exceeds max_payload_size.
  std::optional<std::vector<Chunk>> encode(const MessageId& message_id, std::span<const uint8_t> payload) const;

  size_t symbol_size() const { return symbol_size_; }
  size_t max_payload_size() const { return config_.max_payload_size; }

private:
  CodecConfig config_;
  size_t symbol_size_;
};

struct DecodedMessage {
  MessageId message_id{};
  std::vector<uint8_t> payload;
  // Lowest diffusion height among the frames that carried this message.
  uint8_t height{0};
};

enum class ChunkStatus {
  ACCEPTED,   // stored, message still incomplete
  COMPLETED,  // this chunk completed the message
  IGNORED,    // duplicate symbol, or message already reassembled
  MALFORMED,  // parameters inconsistent
};

struct ChunkResult {
  ChunkStatus status{ChunkStatus::IGNORED};
  std::optional<DecodedMessage> message;
};

/**
 * ChunkDecoder - reassembly of erasure-coded messages
 *
 * Buffers are keyed by BLAKE2s(salt || message_id || encoding parameters):
 * chunks that lie about the parameters land in a buffer of their own and
 * cannot corrupt a legitimate reassembly.
 *
 * Memory is bounded per shard: at most max_pending_messages / REASSEMBLY_SHARDS
 * buffers holding at most max_pending_bytes / REASSEMBLY_SHARDS bytes, and
 * COMPLETED_MARKERS_PER_BUFFER completion markers per buffer slot. The oldest
 * entry goes first when a limit is hit.
 *
 * Thread-safety: buffers live in REASSEMBLY_SHARDS shards with one mutex each.
 * on_chunk() locks a single shard; sweep() visits shards one at a time.
 */
class ChunkDecoder {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit ChunkDecoder(const CodecConfig& config);

  ChunkDecoder(const ChunkDecoder&) = delete;
  ChunkDecoder& operator=(const ChunkDecoder&) = delete;

  ChunkResult on_chunk(const Chunk& chunk, uint8_t height, TimePoint now = util::GetSteadyTime());

  // Drop buffers older than reassembly_timeout and expired completion
  // markers. Returns the number of incomplete messages given up on.
  size_t sweep(TimePoint now = util::GetSteadyTime());

  size_t pending_messages() const;
  size_t pending_bytes() const;
  size_t completed_markers() const;

private:
  using Key = std::array<uint8_t, 32>;

  struct KeyHasher {
    size_t operator()(const Key& key) const noexcept;
  };

  struct Block {
    size_t first_symbol{0};
    size_t source_symbols{0};
    std::map<uint16_t, std::vector<uint8_t>> symbols;
    std::vector<uint8_t> data;  // reconstructed source bytes, once decoded
    bool decoded{false};
  };

  struct Reassembly {
    MessageId message_id{};
    uint32_t transfer_length{0};
    uint16_t symbol_size{0};
    std::vector<Block> blocks;
    size_t blocks_decoded{0};
    uint8_t min_height{0};
    TimePoint created{};
    size_t bytes{0};  // symbol and decoded bytes held
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Key, Reassembly, KeyHasher> buffers;
    size_t bytes{0};
    std::unordered_map<Key, TimePoint, KeyHasher> completed;
    std::deque<std::pair<Key, TimePoint>> completed_order;  // insertion order of `completed`
  };

  Key make_key(const Chunk& chunk) const;
  static bool try_decode_block(Block& block, uint16_t symbol_size);
  static std::vector<uint8_t> assemble(Reassembly& buffer);
  void evict_oldest(Shard& shard, const Key* keep = nullptr);
  void mark_completed(Shard& shard, const Key& key, TimePoint now);

  CodecConfig config_;
  std::array<uint8_t, 16> salt_{};
  size_t max_buffers_per_shard_;
  size_t max_bytes_per_shard_;
  size_t max_completed_per_shard_;
  std::array<Shard, protocol::REASSEMBLY_SHARDS> shards_;
};

}  // namespace transport
}  // namespace kadcast
