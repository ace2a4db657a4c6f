// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the wire format

#include <catch2/catch_test_macros.hpp>

#include "network/message.hpp"

using namespace kadcast;
using namespace kadcast::message;

namespace {

asio::ip::udp::endpoint Ep(const char* ip, uint16_t port) {
    return asio::ip::udp::endpoint(asio::ip::make_address(ip), port);
}

Header SenderHeader() {
    Header header;
    header.sender = routing::MakeBinaryId(Ep("127.0.0.1", 9000));
    header.sender_port = 9000;
    return header;
}

}  // namespace

TEST_CASE("Message: serializer primitives are little-endian", "[message]") {
    MessageSerializer s;
    s.write_uint8(0x01);
    s.write_uint16(0x0302);
    s.write_uint32(0x07060504);
    REQUIRE(s.data() == std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7});

    MessageDeserializer d(s.data());
    REQUIRE(d.read_uint8() == 0x01);
    REQUIRE(d.read_uint16() == 0x0302);
    REQUIRE(d.read_uint32() == 0x07060504);
    REQUIRE(d.bytes_remaining() == 0);
    REQUIRE_FALSE(d.has_error());

    SECTION("Reading past the end sets the error flag") {
        REQUIRE(d.read_uint16() == 0);
        REQUIRE(d.has_error());
        REQUIRE(d.bytes_remaining() == 0);
    }
}

TEST_CASE("Message: header layout", "[message]") {
    const Header header = SenderHeader();
    const auto bytes = Encode(Envelope{header, PingMessage{}});

    REQUIRE(bytes.size() == protocol::HEADER_SIZE);
    REQUIRE(bytes[0] == protocol::PROTOCOL_VERSION);
    REQUIRE(bytes[1] == static_cast<uint8_t>(protocol::MessageType::PING));
    REQUIRE(std::equal(header.sender.id.begin(), header.sender.id.end(), bytes.begin() + 2));
    // sender_port after id and nonce, little-endian
    const size_t port_at = 2 + protocol::ID_BYTES + protocol::NONCE_BYTES;
    REQUIRE(bytes[port_at] == (9000 & 0xFF));
    REQUIRE(bytes[port_at + 1] == (9000 >> 8));
}

TEST_CASE("Message: every type decodes to what was encoded", "[message]") {
    const Header header = SenderHeader();

    SECTION("Ping and Pong") {
        auto ping = Decode(Encode(Envelope{header, PingMessage{}}));
        REQUIRE(ping.has_value());
        REQUIRE(ping->type() == protocol::MessageType::PING);
        REQUIRE(ping->header.sender == header.sender);
        REQUIRE(ping->header.sender_port == 9000);

        auto pong = Decode(Encode(Envelope{header, PongMessage{}}));
        REQUIRE(pong.has_value());
        REQUIRE(std::holds_alternative<PongMessage>(pong->payload));
    }

    SECTION("FindNodes") {
        FindNodesMessage find;
        find.target[0] = 0xAA;
        find.target[15] = 0x55;
        auto decoded = Decode(Encode(Envelope{header, find}));
        REQUIRE(decoded.has_value());
        REQUIRE(std::get<FindNodesMessage>(decoded->payload).target == find.target);
    }

    SECTION("Nodes with IPv4 and IPv6 entries") {
        NodesMessage nodes;
        nodes.peers.push_back(PeerEntry{routing::MakeBinaryId(Ep("10.0.0.1", 1000)), Ep("10.0.0.1", 1000)});
        nodes.peers.push_back(PeerEntry{routing::MakeBinaryId(Ep("2001:db8::1", 2000)), Ep("2001:db8::1", 2000)});
        auto decoded = Decode(Encode(Envelope{header, nodes}));
        REQUIRE(decoded.has_value());
        const auto& peers = std::get<NodesMessage>(decoded->payload).peers;
        REQUIRE(peers.size() == 2);
        REQUIRE(peers[0].endpoint == Ep("10.0.0.1", 1000));
        REQUIRE(peers[0].binary == nodes.peers[0].binary);
        REQUIRE(peers[1].endpoint == Ep("2001:db8::1", 2000));
    }

    SECTION("Broadcast") {
        BroadcastMessage broadcast;
        broadcast.height = 17;
        broadcast.chunk.message_id.fill(0x42);
        broadcast.chunk.transfer_length = 5;
        broadcast.chunk.symbol_size = 8;
        broadcast.chunk.block_count = 1;
        broadcast.chunk.block_index = 0;
        broadcast.chunk.block_source_symbols = 1;
        broadcast.chunk.symbol_index = 3;
        broadcast.chunk.symbol = {1, 2, 3, 4, 5, 0, 0, 0};

        const auto bytes = Encode(Envelope{header, broadcast});
        REQUIRE(bytes.size() == protocol::BROADCAST_OVERHEAD + 8);

        auto decoded = Decode(bytes);
        REQUIRE(decoded.has_value());
        const auto& m = std::get<BroadcastMessage>(decoded->payload);
        REQUIRE(m.height == 17);
        REQUIRE(m.chunk.message_id == broadcast.chunk.message_id);
        REQUIRE(m.chunk.transfer_length == 5);
        REQUIRE(m.chunk.symbol_index == 3);
        REQUIRE(m.chunk.symbol == broadcast.chunk.symbol);
    }
}

TEST_CASE("Message: Nodes responses are capped", "[message]") {
    NodesMessage nodes;
    const auto binary = routing::MakeBinaryId(Ep("10.0.0.1", 1000));
    for (size_t i = 0; i < protocol::MAX_NODES_PER_RESPONSE + 5; ++i) {
        nodes.peers.push_back(PeerEntry{binary, Ep("10.0.0.1", static_cast<uint16_t>(1000 + i))});
    }
    auto decoded = Decode(Encode(Envelope{SenderHeader(), nodes}));
    REQUIRE(decoded.has_value());
    REQUIRE(std::get<NodesMessage>(decoded->payload).peers.size() == protocol::MAX_NODES_PER_RESPONSE);
}

TEST_CASE("Message: malformed input is rejected", "[message]") {
    const Header header = SenderHeader();
    const auto ping = Encode(Envelope{header, PingMessage{}});

    SECTION("Empty and truncated") {
        REQUIRE_FALSE(Decode(std::vector<uint8_t>{}).has_value());
        for (size_t n = 1; n < ping.size(); ++n) {
            REQUIRE_FALSE(Decode(ping.data(), n).has_value());
        }
    }

    SECTION("Unknown version") {
        auto bytes = ping;
        bytes[0] = protocol::PROTOCOL_VERSION + 1;
        REQUIRE_FALSE(Decode(bytes).has_value());
    }

    SECTION("Unknown type") {
        auto bytes = ping;
        bytes[1] = 0x7F;
        REQUIRE_FALSE(Decode(bytes).has_value());
    }

    SECTION("Trailing bytes") {
        auto bytes = ping;
        bytes.push_back(0);
        REQUIRE_FALSE(Decode(bytes).has_value());
    }

    SECTION("Zero sender port") {
        Header zero = header;
        zero.sender_port = 0;
        REQUIRE_FALSE(Decode(Encode(Envelope{zero, PingMessage{}})).has_value());
    }

    SECTION("Nodes count above the cap") {
        MessageSerializer s;
        s.write_bytes(ping);
        s.write_uint16(static_cast<uint16_t>(protocol::MAX_NODES_PER_RESPONSE + 1));
        auto bytes = s.release();
        bytes[1] = static_cast<uint8_t>(protocol::MessageType::NODES);
        REQUIRE_FALSE(Decode(bytes).has_value());
    }

    SECTION("Nodes entry with unknown address family") {
        MessageSerializer s;
        s.write_bytes(ping);
        s.write_uint16(1);
        s.write_uint8(5);
        s.write_bytes(std::vector<uint8_t>(4 + 2 + protocol::ID_BYTES + protocol::NONCE_BYTES, 1));
        auto bytes = s.release();
        bytes[1] = static_cast<uint8_t>(protocol::MessageType::NODES);
        REQUIRE_FALSE(Decode(bytes).has_value());
    }

    SECTION("Broadcast symbol length disagrees with symbol_size") {
        BroadcastMessage broadcast;
        broadcast.chunk.transfer_length = 4;
        broadcast.chunk.symbol_size = 8;
        broadcast.chunk.block_count = 1;
        broadcast.chunk.block_source_symbols = 1;
        broadcast.chunk.symbol = std::vector<uint8_t>(8, 0);
        auto bytes = Encode(Envelope{header, broadcast});
        bytes.pop_back();
        REQUIRE_FALSE(Decode(bytes).has_value());
    }
}

TEST_CASE("Message: type names", "[message]") {
    REQUIRE(protocol::MessageTypeName(protocol::MessageType::FIND_NODES) == "find_nodes");
    REQUIRE(protocol::ParseMessageType(10) == protocol::MessageType::BROADCAST);
    REQUIRE_FALSE(protocol::ParseMessageType(4).has_value());
}
