// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "util/netaddress.hpp"

#include <algorithm>

namespace kadcast {
namespace message {

namespace {

constexpr uint8_t FAMILY_V4 = 4;
constexpr uint8_t FAMILY_V6 = 6;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void WritePeerEntry(MessageSerializer& s, const PeerEntry& entry) {
  const auto address = util::NormalizeAddress(entry.endpoint.address());
  if (address.is_v4()) {
    s.write_uint8(FAMILY_V4);
    s.write_array(address.to_v4().to_bytes());
  } else {
    s.write_uint8(FAMILY_V6);
    s.write_array(address.to_v6().to_bytes());
  }
  s.write_uint16(entry.endpoint.port());
  s.write_array(entry.binary.id);
  s.write_array(entry.binary.nonce);
}

bool ReadPeerEntry(MessageDeserializer& d, PeerEntry& entry) {
  const uint8_t family = d.read_uint8();
  asio::ip::address address;
  if (family == FAMILY_V4) {
    address = asio::ip::address_v4(d.read_array<4>());
  } else if (family == FAMILY_V6) {
    address = asio::ip::address_v6(d.read_array<16>());
  } else {
    return false;
  }
  const uint16_t port = d.read_uint16();
  entry.binary.id = d.read_array<protocol::ID_BYTES>();
  entry.binary.nonce = d.read_array<protocol::NONCE_BYTES>();
  entry.endpoint = asio::ip::udp::endpoint(address, port);
  return !d.has_error() && port != 0;
}

void WriteChunk(MessageSerializer& s, const transport::Chunk& chunk) {
  s.write_array(chunk.message_id);
  s.write_uint32(chunk.transfer_length);
  s.write_uint16(chunk.symbol_size);
  s.write_uint16(chunk.block_count);
  s.write_uint16(chunk.block_index);
  s.write_uint16(chunk.block_source_symbols);
  s.write_uint16(chunk.symbol_index);
  s.write_bytes(chunk.symbol);
}

bool ReadChunk(MessageDeserializer& d, transport::Chunk& chunk) {
  chunk.message_id = d.read_array<protocol::MESSAGE_ID_BYTES>();
  chunk.transfer_length = d.read_uint32();
  chunk.symbol_size = d.read_uint16();
  chunk.block_count = d.read_uint16();
  chunk.block_index = d.read_uint16();
  chunk.block_source_symbols = d.read_uint16();
  chunk.symbol_index = d.read_uint16();
  if (d.has_error() || chunk.symbol_size == 0 || d.bytes_remaining() != chunk.symbol_size) {
    return false;
  }
  chunk.symbol = d.read_bytes(chunk.symbol_size);
  return !d.has_error();
}

}  // namespace

// ============================================================================
// MessageSerializer
// ============================================================================

void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
  buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void MessageSerializer::write_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(const uint8_t* data, size_t size) : data_(data), size_(size) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || size_ - position_ < bytes) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1)) {
    return 0;
  }
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2)) {
    return 0;
  }
  const uint16_t value = static_cast<uint16_t>(data_[position_] | (data_[position_ + 1] << 8));
  position_ += 2;
  return value;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4)) {
    return 0;
  }
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 4;
  return value;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count)) {
    return {};
  }
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

// ============================================================================
// Envelope
// ============================================================================

protocol::MessageType Envelope::type() const {
  return std::visit(Overloaded{
                        [](const PingMessage&) { return protocol::MessageType::PING; },
                        [](const PongMessage&) { return protocol::MessageType::PONG; },
                        [](const FindNodesMessage&) { return protocol::MessageType::FIND_NODES; },
                        [](const NodesMessage&) { return protocol::MessageType::NODES; },
                        [](const BroadcastMessage&) { return protocol::MessageType::BROADCAST; },
                    },
                    payload);
}

std::vector<uint8_t> Encode(const Envelope& envelope) {
  MessageSerializer s;
  s.reserve(protocol::HEADER_SIZE + 64);

  s.write_uint8(protocol::PROTOCOL_VERSION);
  s.write_uint8(static_cast<uint8_t>(envelope.type()));
  s.write_array(envelope.header.sender.id);
  s.write_array(envelope.header.sender.nonce);
  s.write_uint16(envelope.header.sender_port);
  s.write_uint16(0);  // reserved

  std::visit(Overloaded{
                 [](const PingMessage&) {},
                 [](const PongMessage&) {},
                 [&](const FindNodesMessage& m) { s.write_array(m.target); },
                 [&](const NodesMessage& m) {
                   const size_t count = std::min(m.peers.size(), protocol::MAX_NODES_PER_RESPONSE);
                   s.write_uint16(static_cast<uint16_t>(count));
                   for (size_t i = 0; i < count; ++i) {
                     WritePeerEntry(s, m.peers[i]);
                   }
                 },
                 [&](const BroadcastMessage& m) {
                   s.reserve(protocol::BROADCAST_OVERHEAD + m.chunk.symbol.size());
                   s.write_uint8(m.height);
                   WriteChunk(s, m.chunk);
                 },
             },
             envelope.payload);

  return s.release();
}

std::optional<Envelope> Decode(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);

  if (d.read_uint8() != protocol::PROTOCOL_VERSION) {
    return std::nullopt;
  }
  auto type = protocol::ParseMessageType(d.read_uint8());
  if (!type) {
    return std::nullopt;
  }

  Envelope envelope;
  envelope.header.sender.id = d.read_array<protocol::ID_BYTES>();
  envelope.header.sender.nonce = d.read_array<protocol::NONCE_BYTES>();
  envelope.header.sender_port = d.read_uint16();
  d.read_uint16();  // reserved
  if (d.has_error() || envelope.header.sender_port == 0) {
    return std::nullopt;
  }

  switch (*type) {
    case protocol::MessageType::PING:
      envelope.payload = PingMessage{};
      break;
    case protocol::MessageType::PONG:
      envelope.payload = PongMessage{};
      break;
    case protocol::MessageType::FIND_NODES: {
      FindNodesMessage m;
      m.target = d.read_array<protocol::ID_BYTES>();
      envelope.payload = m;
      break;
    }
    case protocol::MessageType::NODES: {
      NodesMessage m;
      const uint16_t count = d.read_uint16();
      if (count > protocol::MAX_NODES_PER_RESPONSE) {
        return std::nullopt;
      }
      m.peers.reserve(count);
      for (uint16_t i = 0; i < count; ++i) {
        PeerEntry entry;
        if (!ReadPeerEntry(d, entry)) {
          return std::nullopt;
        }
        m.peers.push_back(std::move(entry));
      }
      envelope.payload = std::move(m);
      break;
    }
    case protocol::MessageType::BROADCAST: {
      BroadcastMessage m;
      m.height = d.read_uint8();
      if (!ReadChunk(d, m.chunk)) {
        return std::nullopt;
      }
      envelope.payload = std::move(m);
      break;
    }
  }

  if (d.has_error() || d.bytes_remaining() != 0) {
    return std::nullopt;
  }
  return envelope;
}

}  // namespace message
}  // namespace kadcast
