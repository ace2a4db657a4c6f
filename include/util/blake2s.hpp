// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license.

#ifndef KADCAST_UTIL_BLAKE2S_HPP
#define KADCAST_UTIL_BLAKE2S_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace kadcast {
namespace util {

// BLAKE2s (RFC 7693), unkeyed, digest length 1..32 bytes.
// Used for node identifiers, identity proof-of-work and reassembly keys.

class Blake2sHasher {
public:
    static constexpr size_t MAX_OUTPUT_SIZE = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    explicit Blake2sHasher(size_t output_size = MAX_OUTPUT_SIZE);

    Blake2sHasher& Write(const uint8_t* data, size_t len);
    Blake2sHasher& Write(std::span<const uint8_t> data) { return Write(data.data(), data.size()); }

    // Writes output_size bytes to out. Hasher state is left untouched.
    void Finalize(uint8_t* out) const;

    size_t OutputSize() const { return output_size_; }

private:
    void Compress(const uint8_t* block, bool last);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, BLOCK_SIZE> buf_{};
    size_t buf_len_{0};
    uint64_t counter_{0};
    size_t output_size_;
};

// One-shot helper returning the full 32-byte digest.
std::array<uint8_t, 32> Blake2s256(std::span<const uint8_t> data);

}  // namespace util
}  // namespace kadcast

#endif  // KADCAST_UTIL_BLAKE2S_HPP
