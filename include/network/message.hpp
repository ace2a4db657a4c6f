// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "routing/node_id.hpp"
#include "transport/chunk_codec.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include <asio/ip/udp.hpp>

namespace kadcast {
namespace message {

// Little-endian writer for wire messages
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_bytes(const uint8_t* data, size_t len);
  void write_bytes(const std::vector<uint8_t>& data) { write_bytes(data.data(), data.size()); }

  template <size_t N>
  void write_array(const std::array<uint8_t, N>& data) {
    write_bytes(data.data(), N);
  }

  void reserve(size_t n) { buffer_.reserve(n); }
  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

// Little-endian reader. Reading past the end sets the error flag and yields
// zeros; callers check has_error() once at the end.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t* data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t>& data);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  std::vector<uint8_t> read_bytes(size_t count);

  template <size_t N>
  std::array<uint8_t, N> read_array() {
    std::array<uint8_t, N> out{};
    if (check_available(N)) {
      std::copy(data_ + position_, data_ + position_ + N, out.begin());
      position_ += N;
    }
    return out;
  }

  size_t bytes_remaining() const { return error_ ? 0 : size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

private:
  bool check_available(size_t bytes);

  const uint8_t* data_;
  size_t size_;
  size_t position_{0};
  bool error_{false};
};

// Sender identity carried by every message
struct Header {
  routing::BinaryId sender;
  uint16_t sender_port{0};
};

struct PingMessage {};
struct PongMessage {};

struct FindNodesMessage {
  routing::NodeId target{};
};

struct PeerEntry {
  routing::BinaryId binary;
  asio::ip::udp::endpoint endpoint;
};

struct NodesMessage {
  std::vector<PeerEntry> peers;
};

struct BroadcastMessage {
  uint8_t height{0};
  transport::Chunk chunk;
};

using Payload = std::variant<PingMessage, PongMessage, FindNodesMessage, NodesMessage, BroadcastMessage>;

struct Envelope {
  Header header;
  Payload payload;

  protocol::MessageType type() const;
};

std::vector<uint8_t> Encode(const Envelope& envelope);

// std::nullopt on unknown version or type, truncation, trailing bytes or
// out-of-range fields.
std::optional<Envelope> Decode(const uint8_t* data, size_t size);
inline std::optional<Envelope> Decode(const std::vector<uint8_t>& data) {
  return Decode(data.data(), data.size());
}

}  // namespace message
}  // namespace kadcast
