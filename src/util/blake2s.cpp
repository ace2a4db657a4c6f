// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#include "util/blake2s.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <stdexcept>

namespace kadcast {
namespace util {

namespace {

constexpr std::array<uint32_t, 8> IV = {
    0x6A09E667UL, 0xBB67AE85UL, 0x3C6EF372UL, 0xA54FF53AUL,
    0x510E527FUL, 0x9B05688CUL, 0x1F83D9ABUL, 0x5BE0CD19UL,
};

constexpr uint8_t SIGMA[10][16] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3},
    {11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4},
    {7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8},
    {9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13},
    {2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9},
    {12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11},
    {13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10},
    {6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5},
    {10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0},
};

inline uint32_t ReadLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline void G(uint32_t* v, int a, int b, int c, int d, uint32_t x, uint32_t y) {
    v[a] = v[a] + v[b] + x;
    v[d] = std::rotr(v[d] ^ v[a], 16);
    v[c] = v[c] + v[d];
    v[b] = std::rotr(v[b] ^ v[c], 12);
    v[a] = v[a] + v[b] + y;
    v[d] = std::rotr(v[d] ^ v[a], 8);
    v[c] = v[c] + v[d];
    v[b] = std::rotr(v[b] ^ v[c], 7);
}

}  // namespace

Blake2sHasher::Blake2sHasher(size_t output_size) : h_(IV), output_size_(output_size) {
    if (output_size == 0 || output_size > MAX_OUTPUT_SIZE) {
        throw std::invalid_argument("BLAKE2s output size must be in 1..32");
    }
    // Parameter block: digest length, key length 0, fanout 1, depth 1.
    h_[0] ^= 0x01010000UL ^ static_cast<uint32_t>(output_size);
}

void Blake2sHasher::Compress(const uint8_t* block, bool last) {
    uint32_t m[16];
    for (int i = 0; i < 16; ++i) {
        m[i] = ReadLE32(block + 4 * i);
    }

    uint32_t v[16];
    for (int i = 0; i < 8; ++i) {
        v[i] = h_[i];
        v[i + 8] = IV[i];
    }
    v[12] ^= static_cast<uint32_t>(counter_);
    v[13] ^= static_cast<uint32_t>(counter_ >> 32);
    if (last) {
        v[14] = ~v[14];
    }

    for (const auto& s : SIGMA) {
        G(v, 0, 4, 8, 12, m[s[0]], m[s[1]]);
        G(v, 1, 5, 9, 13, m[s[2]], m[s[3]]);
        G(v, 2, 6, 10, 14, m[s[4]], m[s[5]]);
        G(v, 3, 7, 11, 15, m[s[6]], m[s[7]]);
        G(v, 0, 5, 10, 15, m[s[8]], m[s[9]]);
        G(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
        G(v, 2, 7, 8, 13, m[s[12]], m[s[13]]);
        G(v, 3, 4, 9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        h_[i] ^= v[i] ^ v[i + 8];
    }
}

Blake2sHasher& Blake2sHasher::Write(const uint8_t* data, size_t len) {
    while (len > 0) {
        // The final block must go through Compress(last=true), so a full
        // buffer is only flushed once more input is known to follow.
        if (buf_len_ == BLOCK_SIZE) {
            counter_ += BLOCK_SIZE;
            Compress(buf_.data(), false);
            buf_len_ = 0;
        }
        const size_t n = std::min(BLOCK_SIZE - buf_len_, len);
        std::memcpy(buf_.data() + buf_len_, data, n);
        buf_len_ += n;
        data += n;
        len -= n;
    }
    return *this;
}

void Blake2sHasher::Finalize(uint8_t* out) const {
    Blake2sHasher tail(*this);
    tail.counter_ += tail.buf_len_;
    std::fill(tail.buf_.begin() + static_cast<std::ptrdiff_t>(tail.buf_len_), tail.buf_.end(), 0);
    tail.Compress(tail.buf_.data(), true);

    uint8_t digest[MAX_OUTPUT_SIZE];
    for (int i = 0; i < 8; ++i) {
        digest[4 * i] = static_cast<uint8_t>(tail.h_[i]);
        digest[4 * i + 1] = static_cast<uint8_t>(tail.h_[i] >> 8);
        digest[4 * i + 2] = static_cast<uint8_t>(tail.h_[i] >> 16);
        digest[4 * i + 3] = static_cast<uint8_t>(tail.h_[i] >> 24);
    }
    std::memcpy(out, digest, output_size_);
}

std::array<uint8_t, 32> Blake2s256(std::span<const uint8_t> data) {
    std::array<uint8_t, 32> out{};
    Blake2sHasher(32).Write(data).Finalize(out.data());
    return out;
}

}  // namespace util
}  // namespace kadcast
