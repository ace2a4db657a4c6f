// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kadcast {
namespace protocol {

// Wire protocol version carried in every header
constexpr uint8_t PROTOCOL_VERSION = 1;

// Message type tags (first byte after the version)
enum class MessageType : uint8_t {
  PING = 0,
  PONG = 1,
  FIND_NODES = 2,
  NODES = 3,
  BROADCAST = 10,
};

std::optional<MessageType> ParseMessageType(uint8_t raw);
std::string MessageTypeName(MessageType type);

// Identity
constexpr size_t ID_BYTES = 16;
constexpr size_t ID_BITS = ID_BYTES * 8;  // also the number of routing buckets
constexpr size_t NONCE_BYTES = 4;
constexpr unsigned ID_DIFFICULTY_BITS = 8;  // leading zero bits of BLAKE2s(id || nonce)

// Message identifiers for broadcasts
constexpr size_t MESSAGE_ID_BYTES = 32;

// Wire layout
// Header: version(1) type(1) id(16) nonce(4) sender_port(2) reserved(2)
constexpr size_t HEADER_SIZE = 1 + 1 + ID_BYTES + NONCE_BYTES + 2 + 2;
// Chunk: message_id(32) transfer_length(4) symbol_size(2) block_count(2)
//        block_index(2) block_source_symbols(2) symbol_index(2)
constexpr size_t CHUNK_HEADER_SIZE = MESSAGE_ID_BYTES + 4 + 2 + 2 + 2 + 2 + 2;
// Full broadcast datagram overhead: header + height(1) + chunk header
constexpr size_t BROADCAST_OVERHEAD = HEADER_SIZE + 1 + CHUNK_HEADER_SIZE;
// Nodes entry upper bound: family(1) ip(16) port(2) id(16) nonce(4)
constexpr size_t MAX_PEER_ENTRY_SIZE = 1 + 16 + 2 + ID_BYTES + NONCE_BYTES;

// Largest UDP payload we will ever read
constexpr size_t MAX_DATAGRAM_SIZE = 65507;

// Kademlia parameters
constexpr size_t DEFAULT_K = 20;     // bucket capacity
constexpr size_t DEFAULT_ALPHA = 3;  // parallelism of discovery lookups
constexpr size_t DEFAULT_BETA = 3;   // redundancy factor of diffusion
constexpr size_t MAX_NODES_PER_RESPONSE = DEFAULT_K;

// Bucket timing
constexpr std::chrono::milliseconds DEFAULT_NODE_TTL{30000};
constexpr std::chrono::milliseconds DEFAULT_NODE_EVICT_AFTER{5000};
constexpr std::chrono::milliseconds DEFAULT_BUCKET_TTL{60 * 60 * 1000};

// Erasure code
constexpr size_t DEFAULT_MTU = 1300;  // max datagram size for broadcast chunks
constexpr double DEFAULT_FEC_REDUNDANCY = 0.15;
constexpr size_t DEFAULT_MIN_REPAIR_PER_BLOCK = 5;
constexpr size_t MAX_SYMBOLS_PER_BLOCK = 256;         // GF(2^8) limit on k + m
constexpr size_t MAX_SOURCE_SYMBOLS_PER_BLOCK = 192;  // leaves room for repair symbols
constexpr size_t DEFAULT_MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;
constexpr size_t MIN_SYMBOL_SIZE = 16;

// Caches
constexpr std::chrono::milliseconds DEFAULT_SEEN_CACHE_TTL{5 * 60 * 1000};
constexpr std::chrono::milliseconds DEFAULT_REASSEMBLY_TIMEOUT{30000};
constexpr std::chrono::milliseconds DEFAULT_SWEEP_INTERVAL{5000};
constexpr size_t DEFAULT_MAX_PENDING_MESSAGES = 4096;
constexpr size_t DEFAULT_MAX_PENDING_BYTES = 256 * 1024 * 1024;  // symbol and decoded bytes held for reassembly
constexpr size_t COMPLETED_MARKERS_PER_BUFFER = 8;
constexpr size_t DEFAULT_MAX_SEEN_ENTRIES = 100000;
constexpr size_t REASSEMBLY_SHARDS = 16;

// Discovery
constexpr std::chrono::milliseconds DEFAULT_PING_INTERVAL{10000};
constexpr std::chrono::milliseconds DEFAULT_PING_TIMEOUT{5000};

// UDP transport
constexpr unsigned DEFAULT_SEND_RETRY_COUNT = 3;
constexpr std::chrono::milliseconds DEFAULT_SEND_RETRY_INTERVAL{5};
constexpr uint16_t DEFAULT_PORT = 9000;

// Threads running the io_context
constexpr size_t DEFAULT_IO_THREADS = 2;

}  // namespace protocol
}  // namespace kadcast
