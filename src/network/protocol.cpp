// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"

namespace kadcast {
namespace protocol {

std::optional<MessageType> ParseMessageType(uint8_t raw) {
  switch (raw) {
    case static_cast<uint8_t>(MessageType::PING):
      return MessageType::PING;
    case static_cast<uint8_t>(MessageType::PONG):
      return MessageType::PONG;
    case static_cast<uint8_t>(MessageType::FIND_NODES):
      return MessageType::FIND_NODES;
    case static_cast<uint8_t>(MessageType::NODES):
      return MessageType::NODES;
    case static_cast<uint8_t>(MessageType::BROADCAST):
      return MessageType::BROADCAST;
    default:
      return std::nullopt;
  }
}

std::string MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::PING:
      return "ping";
    case MessageType::PONG:
      return "pong";
    case MessageType::FIND_NODES:
      return "find_nodes";
    case MessageType::NODES:
      return "nodes";
    case MessageType::BROADCAST:
      return "broadcast";
  }
  return "unknown";
}

}  // namespace protocol
}  // namespace kadcast
