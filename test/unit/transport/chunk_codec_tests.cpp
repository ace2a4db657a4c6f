// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chunking, block layout and reassembly

#include <catch2/catch_test_macros.hpp>

#include "transport/chunk_codec.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

using namespace kadcast;
using namespace kadcast::transport;
using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> RandomPayload(size_t size, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<uint8_t>(byte(rng));
    }
    return out;
}

MessageId IdFor(uint8_t tag) {
    MessageId id{};
    id.fill(tag);
    return id;
}

MessageId IdForIndex(uint32_t index) {
    MessageId id{};
    id[0] = static_cast<uint8_t>(index);
    id[1] = static_cast<uint8_t>(index >> 8);
    id[2] = static_cast<uint8_t>(index >> 16);
    id[3] = 0xA5;
    return id;
}

// Feed chunks until the decoder completes. Returns the decoded message, if any.
std::optional<DecodedMessage> Feed(ChunkDecoder& decoder, const std::vector<Chunk>& chunks, uint8_t height = 0) {
    for (const auto& chunk : chunks) {
        auto result = decoder.on_chunk(chunk, height);
        if (result.status == ChunkStatus::COMPLETED) {
            return result.message;
        }
    }
    return std::nullopt;
}

}  // namespace

TEST_CASE("ChunkCodec: symbol size and repair count", "[transport][chunk_codec]") {
    REQUIRE(SymbolSizeForMtu(protocol::BROADCAST_OVERHEAD) == 0);
    REQUIRE(SymbolSizeForMtu(1300) == 1300 - protocol::BROADCAST_OVERHEAD);

    CodecConfig config;
    config.fec_redundancy = 0.15;
    config.min_repair_per_block = 5;
    REQUIRE(RepairSymbolsFor(1, config) == 5);
    REQUIRE(RepairSymbolsFor(100, config) == 15);
    REQUIRE(RepairSymbolsFor(192, config) == 29);
    REQUIRE(RepairSymbolsFor(254, config) == 2);

    config.mtu = protocol::BROADCAST_OVERHEAD + 4;
    REQUIRE_THROWS_AS(ChunkEncoder(config), std::invalid_argument);
}

TEST_CASE("ChunkCodec: block layout", "[transport][chunk_codec]") {
    SECTION("Empty payload is one block of one symbol") {
        auto layout = ComputeLayout(0, 100);
        REQUIRE(layout.has_value());
        REQUIRE(layout->size() == 1);
        REQUIRE((*layout)[0].source_symbols == 1);
    }

    SECTION("Blocks differ in size by at most one symbol and tile the transfer") {
        const uint16_t symbol_size = 100;
        const uint32_t length = 100 * 500 + 17;  // 501 symbols
        auto layout = ComputeLayout(length, symbol_size);
        REQUIRE(layout.has_value());
        REQUIRE(layout->size() == 3);

        size_t next = 0;
        size_t smallest = SIZE_MAX;
        size_t largest = 0;
        for (const auto& block : *layout) {
            REQUIRE(block.first_symbol == next);
            REQUIRE(block.source_symbols <= protocol::MAX_SOURCE_SYMBOLS_PER_BLOCK);
            next += block.source_symbols;
            smallest = std::min(smallest, block.source_symbols);
            largest = std::max(largest, block.source_symbols);
        }
        REQUIRE(next == 501);
        REQUIRE(largest - smallest <= 1);
    }

    SECTION("Zero symbol size") {
        REQUIRE_FALSE(ComputeLayout(10, 0).has_value());
    }
}

TEST_CASE("ChunkCodec: encode emits source then repair chunks", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    const auto payload = RandomPayload(encoder.symbol_size() * 3 + 10, 1);

    auto chunks = encoder.encode(IdFor(1), payload);
    REQUIRE(chunks.has_value());
    REQUIRE(chunks->size() == 4 + RepairSymbolsFor(4, config));

    for (size_t i = 0; i < chunks->size(); ++i) {
        const auto& chunk = (*chunks)[i];
        REQUIRE(chunk.message_id == IdFor(1));
        REQUIRE(chunk.transfer_length == payload.size());
        REQUIRE(chunk.block_count == 1);
        REQUIRE(chunk.block_source_symbols == 4);
        REQUIRE(chunk.symbol_index == i);
        REQUIRE(chunk.symbol.size() == encoder.symbol_size());
    }

    SECTION("Oversized payload refused") {
        CodecConfig small = config;
        small.max_payload_size = 100;
        ChunkEncoder limited(small);
        REQUIRE_FALSE(limited.encode(IdFor(2), RandomPayload(101, 2)).has_value());
        REQUIRE(limited.encode(IdFor(2), RandomPayload(100, 2)).has_value());
    }
}

TEST_CASE("ChunkCodec: reassembly", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    ChunkDecoder decoder(config);

    SECTION("In order") {
        const auto payload = RandomPayload(100 * 1024, 3);
        auto chunks = *encoder.encode(IdFor(3), payload);
        auto message = Feed(decoder, chunks);
        REQUIRE(message.has_value());
        REQUIRE(message->payload == payload);
        REQUIRE(message->message_id == IdFor(3));
        REQUIRE(decoder.pending_messages() == 0);
    }

    SECTION("Shuffled with losses within the repair budget") {
        const auto payload = RandomPayload(300 * 1024, 4);
        auto chunks = *encoder.encode(IdFor(4), payload);

        // Drop two chunks of every block.
        std::vector<Chunk> kept;
        std::map<uint16_t, int> dropped;
        for (auto& chunk : chunks) {
            if (dropped[chunk.block_index] < 2) {
                ++dropped[chunk.block_index];
                continue;
            }
            kept.push_back(std::move(chunk));
        }
        std::mt19937_64 rng(5);
        std::shuffle(kept.begin(), kept.end(), rng);

        auto message = Feed(decoder, kept);
        REQUIRE(message.has_value());
        REQUIRE(message->payload == payload);
    }

    SECTION("Empty payload") {
        auto chunks = *encoder.encode(IdFor(5), std::span<const uint8_t>{});
        auto message = Feed(decoder, chunks);
        REQUIRE(message.has_value());
        REQUIRE(message->payload.empty());
    }

    SECTION("Too many losses never complete") {
        const auto payload = RandomPayload(encoder.symbol_size() * 10, 6);
        auto chunks = *encoder.encode(IdFor(6), payload);
        chunks.resize(9);
        REQUIRE_FALSE(Feed(decoder, chunks).has_value());
        REQUIRE(decoder.pending_messages() == 1);
    }
}

TEST_CASE("ChunkCodec: payload sizes around symbol and block boundaries", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    const size_t s = encoder.symbol_size();
    const size_t block = protocol::MAX_SOURCE_SYMBOLS_PER_BLOCK * s;

    const std::vector<size_t> sizes = {1, s - 1, s, s + 1, block - 1, block, block + 1};
    for (size_t i = 0; i < sizes.size(); ++i) {
        const size_t size = sizes[i];
        INFO("payload size " << size);
        ChunkDecoder decoder(config);
        const auto payload = RandomPayload(size, 100 + i);
        auto chunks = encoder.encode(IdForIndex(static_cast<uint32_t>(i)), payload);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->front().block_count == (size > block ? 2 : 1));

        auto message = Feed(decoder, *chunks);
        REQUIRE(message.has_value());
        REQUIRE(message->payload == payload);
        REQUIRE(decoder.pending_messages() == 0);
        REQUIRE(decoder.pending_bytes() == 0);
    }
}

TEST_CASE("ChunkCodec: duplicates and completed messages", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    ChunkDecoder decoder(config);
    const auto payload = RandomPayload(encoder.symbol_size() * 2, 7);
    auto chunks = *encoder.encode(IdFor(7), payload);

    REQUIRE(decoder.on_chunk(chunks[0], 0).status == ChunkStatus::ACCEPTED);
    REQUIRE(decoder.on_chunk(chunks[0], 0).status == ChunkStatus::IGNORED);
    REQUIRE(decoder.on_chunk(chunks[1], 0).status == ChunkStatus::COMPLETED);

    // Late chunks of a reassembled message are ignored, not reassembled again.
    for (size_t i = 2; i < chunks.size(); ++i) {
        REQUIRE(decoder.on_chunk(chunks[i], 0).status == ChunkStatus::IGNORED);
    }
}

TEST_CASE("ChunkCodec: reassembled height is the lowest seen", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    ChunkDecoder decoder(config);
    auto chunks = *encoder.encode(IdFor(8), RandomPayload(encoder.symbol_size() * 3, 8));

    decoder.on_chunk(chunks[0], 9);
    decoder.on_chunk(chunks[1], 4);
    auto result = decoder.on_chunk(chunks[2], 7);
    REQUIRE(result.status == ChunkStatus::COMPLETED);
    REQUIRE(result.message->height == 4);
}

TEST_CASE("ChunkCodec: malformed chunks", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    ChunkDecoder decoder(config);
    auto chunks = *encoder.encode(IdFor(9), RandomPayload(encoder.symbol_size() * 2, 9));
    Chunk chunk = chunks[0];

    SECTION("Symbol length disagrees with symbol_size") {
        chunk.symbol.pop_back();
        REQUIRE(decoder.on_chunk(chunk, 0).status == ChunkStatus::MALFORMED);
    }

    SECTION("Wrong block count") {
        chunk.block_count = 2;
        REQUIRE(decoder.on_chunk(chunk, 0).status == ChunkStatus::MALFORMED);
    }

    SECTION("Block index out of range") {
        chunk.block_index = 1;
        REQUIRE(decoder.on_chunk(chunk, 0).status == ChunkStatus::MALFORMED);
    }

    SECTION("Wrong source symbol count") {
        chunk.block_source_symbols = 3;
        REQUIRE(decoder.on_chunk(chunk, 0).status == ChunkStatus::MALFORMED);
    }

    SECTION("Transfer length above the limit") {
        CodecConfig small = config;
        small.max_payload_size = 10;
        ChunkDecoder strict(small);
        REQUIRE(strict.on_chunk(chunk, 0).status == ChunkStatus::MALFORMED);
    }

    REQUIRE(decoder.pending_messages() == 0);
}

TEST_CASE("ChunkCodec: lying parameters get a buffer of their own", "[transport][chunk_codec]") {
    CodecConfig config;
    ChunkEncoder encoder(config);
    ChunkDecoder decoder(config);
    const auto payload = RandomPayload(encoder.symbol_size() * 2, 10);
    auto chunks = *encoder.encode(IdFor(10), payload);

    // Same message id, different but self-consistent transfer length.
    Chunk forged = chunks[0];
    forged.transfer_length = static_cast<uint32_t>(payload.size() - 1);
    REQUIRE(decoder.on_chunk(forged, 0).status == ChunkStatus::ACCEPTED);
    REQUIRE(decoder.pending_messages() == 1);

    auto message = Feed(decoder, chunks);
    REQUIRE(message.has_value());
    REQUIRE(message->payload == payload);
}

TEST_CASE("ChunkCodec: sweep and capacity", "[transport][chunk_codec]") {
    CodecConfig config;
    config.reassembly_timeout = 30s;
    ChunkEncoder encoder(config);
    const auto t0 = util::GetSteadyTime();

    SECTION("Incomplete messages time out") {
        ChunkDecoder decoder(config);
        auto chunks = *encoder.encode(IdFor(11), RandomPayload(encoder.symbol_size() * 4, 11));
        decoder.on_chunk(chunks[0], 0, t0);
        REQUIRE(decoder.sweep(t0 + 10s) == 0);
        REQUIRE(decoder.pending_messages() == 1);
        REQUIRE(decoder.sweep(t0 + 30s) == 1);
        REQUIRE(decoder.pending_messages() == 0);
    }

    SECTION("Completion markers expire too") {
        ChunkDecoder decoder(config);
        auto chunks = *encoder.encode(IdFor(12), RandomPayload(10, 12));
        REQUIRE(decoder.on_chunk(chunks[0], 0, t0).status == ChunkStatus::COMPLETED);
        REQUIRE(decoder.on_chunk(chunks[0], 0, t0 + 1s).status == ChunkStatus::IGNORED);
        decoder.sweep(t0 + 31s);
        REQUIRE(decoder.on_chunk(chunks[0], 0, t0 + 32s).status == ChunkStatus::COMPLETED);
    }

    SECTION("Pending buffers are bounded") {
        CodecConfig bounded = config;
        bounded.max_pending_messages = protocol::REASSEMBLY_SHARDS;  // one per shard
        ChunkDecoder decoder(bounded);
        for (uint8_t tag = 0; tag < 100; ++tag) {
            auto chunks = *encoder.encode(IdFor(tag), RandomPayload(encoder.symbol_size() * 4, tag));
            decoder.on_chunk(chunks[0], 0, t0 + std::chrono::milliseconds(tag));
        }
        REQUIRE(decoder.pending_messages() <= protocol::REASSEMBLY_SHARDS);
    }

    SECTION("Held bytes stay within max_pending_bytes") {
        const size_t s = encoder.symbol_size();
        CodecConfig bounded = config;
        bounded.max_pending_messages = 100000;
        bounded.max_pending_bytes = protocol::REASSEMBLY_SHARDS * 64 * s;
        ChunkDecoder decoder(bounded);

        // 30 source symbols each, only 10 delivered: every message stays incomplete.
        for (uint32_t i = 0; i < 500; ++i) {
            auto chunks = *encoder.encode(IdForIndex(i), RandomPayload(s * 30, i));
            for (size_t c = 0; c < 10; ++c) {
                decoder.on_chunk(chunks[c], 0, t0 + std::chrono::milliseconds(i));
            }
            REQUIRE(decoder.pending_bytes() <= bounded.max_pending_bytes);
        }
        REQUIRE(decoder.pending_bytes() > 0);
        REQUIRE(decoder.pending_messages() < 500);

        // A full message still fits, pushing older partial ones out.
        const auto payload = RandomPayload(s * 30, 9999);
        auto message = Feed(decoder, *encoder.encode(IdForIndex(9999), payload));
        REQUIRE(message.has_value());
        REQUIRE(message->payload == payload);
        REQUIRE(decoder.pending_bytes() <= bounded.max_pending_bytes);

        decoder.sweep(t0 + 60s);
        REQUIRE(decoder.pending_messages() == 0);
        REQUIRE(decoder.pending_bytes() == 0);
    }

    SECTION("A message larger than a shard's byte budget is dropped") {
        const size_t s = encoder.symbol_size();
        CodecConfig bounded = config;
        bounded.max_pending_bytes = protocol::REASSEMBLY_SHARDS * 4 * s;
        ChunkDecoder decoder(bounded);
        auto chunks = *encoder.encode(IdFor(13), RandomPayload(s * 10, 13));
        REQUIRE_FALSE(Feed(decoder, chunks).has_value());
        REQUIRE(decoder.pending_bytes() <= 4 * s);
    }

    SECTION("Completion markers are bounded") {
        CodecConfig bounded = config;
        bounded.max_pending_messages = protocol::REASSEMBLY_SHARDS;  // one per shard
        ChunkDecoder decoder(bounded);
        const size_t limit = protocol::REASSEMBLY_SHARDS * protocol::COMPLETED_MARKERS_PER_BUFFER;

        for (uint32_t i = 0; i < 2000; ++i) {
            auto chunks = *encoder.encode(IdForIndex(i), std::span<const uint8_t>{});
            REQUIRE(decoder.on_chunk(chunks[0], 0, t0).status == ChunkStatus::COMPLETED);
        }
        REQUIRE(decoder.completed_markers() > 0);
        REQUIRE(decoder.completed_markers() <= limit);

        // The newest marker survives the overflow.
        auto latest = *encoder.encode(IdForIndex(1999), std::span<const uint8_t>{});
        REQUIRE(decoder.on_chunk(latest[0], 0, t0).status == ChunkStatus::IGNORED);

        decoder.sweep(t0 + 31s);
        REQUIRE(decoder.completed_markers() == 0);
    }
}

TEST_CASE("ChunkCodec: MessageId helpers", "[transport][chunk_codec]") {
    MessageId id{};
    id[0] = 0xde;
    id[1] = 0xad;
    REQUIRE(ShortHex(id) == "dead000000000000");

    MessageIdHasher hasher;
    REQUIRE(hasher(id) == hasher(id));
}
