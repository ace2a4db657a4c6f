// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "transport/chunk_codec.hpp"

#include "transport/erasure_code.hpp"
#include "util/blake2s.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <random>
#include <stdexcept>

namespace kadcast {
namespace transport {

namespace {

const std::array<uint8_t, 16>& ProcessSalt() {
  static const std::array<uint8_t, 16> salt = [] {
    std::array<uint8_t, 16> s{};
    std::random_device rd;
    for (size_t i = 0; i < s.size(); i += 4) {
      const uint32_t v = rd();
      std::memcpy(s.data() + i, &v, 4);
    }
    return s;
  }();
  return salt;
}

size_t ReadHashPrefix(const uint8_t* data) {
  size_t h = 0;
  std::memcpy(&h, data, sizeof(h));
  return h;
}

void WriteLE(util::Blake2sHasher& hasher, uint64_t value, size_t bytes) {
  uint8_t buf[8];
  for (size_t i = 0; i < bytes; ++i) {
    buf[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  hasher.Write(buf, bytes);
}

}  // namespace

size_t MessageIdHasher::operator()(const MessageId& id) const noexcept {
  util::Blake2sHasher hasher(sizeof(size_t));
  const auto& salt = ProcessSalt();
  hasher.Write(salt.data(), salt.size()).Write(id.data(), id.size());
  uint8_t out[sizeof(size_t)];
  hasher.Finalize(out);
  return ReadHashPrefix(out);
}

std::string ShortHex(const MessageId& id) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (size_t i = 0; i < 8; ++i) {
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0f]);
  }
  return out;
}

size_t SymbolSizeForMtu(size_t mtu) {
  if (mtu <= protocol::BROADCAST_OVERHEAD) {
    return 0;
  }
  return std::min<size_t>(mtu - protocol::BROADCAST_OVERHEAD, UINT16_MAX);
}

size_t RepairSymbolsFor(size_t k, const CodecConfig& config) {
  const auto proportional = static_cast<size_t>(std::ceil(static_cast<double>(k) * config.fec_redundancy));
  const size_t wanted = std::max(config.min_repair_per_block, proportional);
  return std::min(wanted, protocol::MAX_SYMBOLS_PER_BLOCK - k);
}

std::optional<std::vector<BlockLayout>> ComputeLayout(uint32_t transfer_length, uint16_t symbol_size) {
  if (symbol_size == 0) {
    return std::nullopt;
  }
  // An empty payload still travels as one zero-filled symbol.
  const size_t total = std::max<size_t>(1, (static_cast<size_t>(transfer_length) + symbol_size - 1) / symbol_size);
  const size_t block_count =
      (total + protocol::MAX_SOURCE_SYMBOLS_PER_BLOCK - 1) / protocol::MAX_SOURCE_SYMBOLS_PER_BLOCK;
  if (block_count > UINT16_MAX) {
    return std::nullopt;
  }

  // The first `large_blocks` blocks get one symbol more than the rest.
  const size_t small = total / block_count;
  const size_t large_blocks = total - small * block_count;

  std::vector<BlockLayout> layout;
  layout.reserve(block_count);
  size_t next = 0;
  for (size_t b = 0; b < block_count; ++b) {
    const size_t k = small + (b < large_blocks ? 1 : 0);
    layout.push_back(BlockLayout{next, k});
    next += k;
  }
  return layout;
}

// ============================================================================
// ChunkEncoder
// ============================================================================

ChunkEncoder::ChunkEncoder(const CodecConfig& config) : config_(config), symbol_size_(SymbolSizeForMtu(config.mtu)) {
  if (symbol_size_ < protocol::MIN_SYMBOL_SIZE) {
    throw std::invalid_argument("mtu " + std::to_string(config.mtu) + " too small to carry a chunk");
  }
}

std::optional<std::vector<Chunk>> ChunkEncoder::encode(const MessageId& message_id,
                                                       std::span<const uint8_t> payload) const {
  if (payload.size() > config_.max_payload_size || payload.size() > UINT32_MAX) {
    return std::nullopt;
  }
  const auto transfer_length = static_cast<uint32_t>(payload.size());
  const auto symbol_size = static_cast<uint16_t>(symbol_size_);
  auto layout = ComputeLayout(transfer_length, symbol_size);
  if (!layout) {
    return std::nullopt;
  }

  std::vector<Chunk> chunks;
  for (size_t b = 0; b < layout->size(); ++b) {
    const BlockLayout& block = (*layout)[b];

    std::vector<BlockCode::Symbol> sources(block.source_symbols, BlockCode::Symbol(symbol_size, 0));
    for (size_t i = 0; i < block.source_symbols; ++i) {
      const size_t offset = (block.first_symbol + i) * symbol_size;
      if (offset >= payload.size()) {
        break;
      }
      const size_t n = std::min<size_t>(symbol_size, payload.size() - offset);
      std::memcpy(sources[i].data(), payload.data() + offset, n);
    }

    BlockCode code(block.source_symbols);
    auto repair = code.encode(sources, RepairSymbolsFor(block.source_symbols, config_));

    auto emit = [&](uint16_t index, BlockCode::Symbol&& symbol) {
      Chunk chunk;
      chunk.message_id = message_id;
      chunk.transfer_length = transfer_length;
      chunk.symbol_size = symbol_size;
      chunk.block_count = static_cast<uint16_t>(layout->size());
      chunk.block_index = static_cast<uint16_t>(b);
      chunk.block_source_symbols = static_cast<uint16_t>(block.source_symbols);
      chunk.symbol_index = index;
      chunk.symbol = std::move(symbol);
      chunks.push_back(std::move(chunk));
    };

    for (size_t i = 0; i < sources.size(); ++i) {
      emit(static_cast<uint16_t>(i), std::move(sources[i]));
    }
    for (size_t r = 0; r < repair.size(); ++r) {
      emit(static_cast<uint16_t>(block.source_symbols + r), std::move(repair[r]));
    }
  }
  return chunks;
}

// ============================================================================
// ChunkDecoder
// ============================================================================

size_t ChunkDecoder::KeyHasher::operator()(const Key& key) const noexcept {
  return ReadHashPrefix(key.data());
}

ChunkDecoder::ChunkDecoder(const CodecConfig& config)
    : config_(config),
      salt_(ProcessSalt()),
      max_buffers_per_shard_(std::max<size_t>(1, config.max_pending_messages / protocol::REASSEMBLY_SHARDS)),
      max_bytes_per_shard_(std::max<size_t>(1, config.max_pending_bytes / protocol::REASSEMBLY_SHARDS)),
      max_completed_per_shard_(max_buffers_per_shard_ * protocol::COMPLETED_MARKERS_PER_BUFFER) {}

ChunkDecoder::Key ChunkDecoder::make_key(const Chunk& chunk) const {
  util::Blake2sHasher hasher;
  hasher.Write(salt_.data(), salt_.size());
  hasher.Write(chunk.message_id.data(), chunk.message_id.size());
  WriteLE(hasher, chunk.transfer_length, 4);
  WriteLE(hasher, chunk.symbol_size, 2);
  WriteLE(hasher, chunk.block_count, 2);
  Key key{};
  hasher.Finalize(key.data());
  return key;
}

bool ChunkDecoder::try_decode_block(Block& block, uint16_t symbol_size) {
  BlockCode code(block.source_symbols);
  auto sources = code.decode(block.symbols);
  if (!sources) {
    return false;
  }
  block.data.clear();
  block.data.reserve(block.source_symbols * symbol_size);
  for (const auto& symbol : *sources) {
    block.data.insert(block.data.end(), symbol.begin(), symbol.end());
  }
  block.symbols.clear();
  block.decoded = true;
  return true;
}

std::vector<uint8_t> ChunkDecoder::assemble(Reassembly& buffer) {
  std::vector<uint8_t> payload;
  payload.reserve(buffer.transfer_length);
  for (auto& block : buffer.blocks) {
    const size_t room = buffer.transfer_length - payload.size();
    const size_t n = std::min(room, block.data.size());
    payload.insert(payload.end(), block.data.begin(), block.data.begin() + static_cast<std::ptrdiff_t>(n));
  }
  return payload;
}

void ChunkDecoder::evict_oldest(Shard& shard, const Key* keep) {
  auto oldest = shard.buffers.end();
  for (auto it = shard.buffers.begin(); it != shard.buffers.end(); ++it) {
    if (keep != nullptr && it->first == *keep) {
      continue;
    }
    if (oldest == shard.buffers.end() || it->second.created < oldest->second.created) {
      oldest = it;
    }
  }
  if (oldest != shard.buffers.end()) {
    LOG_TRANSPORT_DEBUG("reassembly shard full, dropping oldest pending message ({} bytes)", oldest->second.bytes);
    shard.bytes -= oldest->second.bytes;
    shard.buffers.erase(oldest);
  }
}

void ChunkDecoder::mark_completed(Shard& shard, const Key& key, TimePoint now) {
  if (!shard.completed.emplace(key, now).second) {
    return;
  }
  shard.completed_order.emplace_back(key, now);
  while (shard.completed.size() > max_completed_per_shard_) {
    shard.completed.erase(shard.completed_order.front().first);
    shard.completed_order.pop_front();
  }
}

ChunkResult ChunkDecoder::on_chunk(const Chunk& chunk, uint8_t height, TimePoint now) {
  ChunkResult result;

  if (chunk.symbol_size == 0 || chunk.symbol.size() != chunk.symbol_size ||
      chunk.transfer_length > config_.max_payload_size || chunk.symbol_index >= protocol::MAX_SYMBOLS_PER_BLOCK) {
    result.status = ChunkStatus::MALFORMED;
    return result;
  }
  auto layout = ComputeLayout(chunk.transfer_length, chunk.symbol_size);
  if (!layout || layout->size() != chunk.block_count || chunk.block_index >= chunk.block_count ||
      (*layout)[chunk.block_index].source_symbols != chunk.block_source_symbols) {
    result.status = ChunkStatus::MALFORMED;
    return result;
  }

  const Key key = make_key(chunk);
  Shard& shard = shards_[KeyHasher{}(key) % shards_.size()];
  std::lock_guard<std::mutex> lock(shard.mutex);

  if (shard.completed.count(key) != 0) {
    return result;
  }

  auto it = shard.buffers.find(key);
  if (it == shard.buffers.end()) {
    if (shard.buffers.size() >= max_buffers_per_shard_) {
      evict_oldest(shard);
    }
    Reassembly buffer;
    buffer.message_id = chunk.message_id;
    buffer.transfer_length = chunk.transfer_length;
    buffer.symbol_size = chunk.symbol_size;
    buffer.min_height = height;
    buffer.created = now;
    buffer.blocks.reserve(layout->size());
    for (const auto& b : *layout) {
      Block block;
      block.first_symbol = b.first_symbol;
      block.source_symbols = b.source_symbols;
      buffer.blocks.push_back(std::move(block));
    }
    it = shard.buffers.emplace(key, std::move(buffer)).first;
  }

  Reassembly& buffer = it->second;
  buffer.min_height = std::min(buffer.min_height, height);

  Block& block = buffer.blocks[chunk.block_index];
  if (block.decoded || block.symbols.count(chunk.symbol_index) != 0) {
    return result;
  }
  block.symbols.emplace(chunk.symbol_index, chunk.symbol);
  buffer.bytes += chunk.symbol.size();
  shard.bytes += chunk.symbol.size();
  result.status = ChunkStatus::ACCEPTED;

  if (block.symbols.size() >= block.source_symbols) {
    const size_t held = block.symbols.size() * buffer.symbol_size;
    if (try_decode_block(block, buffer.symbol_size)) {
      ++buffer.blocks_decoded;
      buffer.bytes = buffer.bytes - held + block.data.size();
      shard.bytes = shard.bytes - held + block.data.size();
    }
  }

  if (buffer.blocks_decoded == buffer.blocks.size()) {
    DecodedMessage message;
    message.message_id = buffer.message_id;
    message.payload = assemble(buffer);
    message.height = buffer.min_height;
    shard.bytes -= buffer.bytes;
    shard.buffers.erase(it);
    mark_completed(shard, key, now);

    result.status = ChunkStatus::COMPLETED;
    result.message = std::move(message);
    return result;
  }

  if (buffer.bytes > max_bytes_per_shard_) {
    LOG_TRANSPORT_DEBUG("message {} alone exceeds the reassembly byte budget, dropping it",
                        ShortHex(buffer.message_id));
    shard.bytes -= buffer.bytes;
    shard.buffers.erase(it);
    result.status = ChunkStatus::IGNORED;
    return result;
  }
  while (shard.bytes > max_bytes_per_shard_) {
    evict_oldest(shard, &key);
  }
  return result;
}

size_t ChunkDecoder::sweep(TimePoint now) {
  size_t expired = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.buffers.begin(); it != shard.buffers.end();) {
      if (now - it->second.created >= config_.reassembly_timeout) {
        shard.bytes -= it->second.bytes;
        it = shard.buffers.erase(it);
        ++expired;
      } else {
        ++it;
      }
    }
    while (!shard.completed_order.empty() && now - shard.completed_order.front().second >= config_.reassembly_timeout) {
      shard.completed.erase(shard.completed_order.front().first);
      shard.completed_order.pop_front();
    }
  }
  if (expired > 0) {
    LOG_TRANSPORT_DEBUG("gave up on {} incomplete messages", expired);
  }
  return expired;
}

size_t ChunkDecoder::pending_messages() const {
  size_t total = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.buffers.size();
  }
  return total;
}

size_t ChunkDecoder::pending_bytes() const {
  size_t total = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.bytes;
  }
  return total;
}

size_t ChunkDecoder::completed_markers() const {
  size_t total = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.completed.size();
  }
  return total;
}

}  // namespace transport
}  // namespace kadcast
