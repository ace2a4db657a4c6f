// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// BLAKE2s test vectors (RFC 7693)

#include <catch2/catch_test_macros.hpp>

#include "util/blake2s.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kadcast::util;

namespace {

std::string Hex(const uint8_t* data, size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHex[data[i] >> 4]);
        out.push_back(kHex[data[i] & 0x0f]);
    }
    return out;
}

std::string Digest(const std::string& input) {
    auto digest = Blake2s256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(input.data()), input.size()));
    return Hex(digest.data(), digest.size());
}

}  // namespace

TEST_CASE("Blake2s: RFC 7693 vectors", "[blake2s]") {
    REQUIRE(Digest("abc") == "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
    REQUIRE(Digest("") == "69217a3079908094e11121d042354a7c1f55b6482ca1a51e1b250dfd1ed0eef9");
}

TEST_CASE("Blake2s: incremental writes match one-shot", "[blake2s]") {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    const auto expected = Blake2s256(data);

    // Split points around the 64-byte block boundary
    for (size_t split : {size_t{0}, size_t{1}, size_t{63}, size_t{64}, size_t{65}, size_t{128}, size_t{999}}) {
        Blake2sHasher hasher;
        hasher.Write(data.data(), split).Write(data.data() + split, data.size() - split);
        std::array<uint8_t, 32> out{};
        hasher.Finalize(out.data());
        REQUIRE(out == expected);
    }
}

TEST_CASE("Blake2s: Finalize leaves state untouched", "[blake2s]") {
    const std::string text = "kadcast";
    Blake2sHasher hasher;
    hasher.Write(reinterpret_cast<const uint8_t*>(text.data()), text.size());

    std::array<uint8_t, 32> first{};
    std::array<uint8_t, 32> second{};
    hasher.Finalize(first.data());
    hasher.Finalize(second.data());
    REQUIRE(first == second);
}

TEST_CASE("Blake2s: output size", "[blake2s]") {
    SECTION("Truncated digests differ from prefixes of the full digest") {
        // Output length is a parameter of the hash, not a truncation.
        Blake2sHasher short_hasher(16);
        REQUIRE(short_hasher.OutputSize() == 16);
        std::array<uint8_t, 16> out16{};
        short_hasher.Finalize(out16.data());

        const auto full = Blake2s256({});
        REQUIRE_FALSE(std::equal(out16.begin(), out16.end(), full.begin()));
    }

    SECTION("Out of range sizes throw") {
        REQUIRE_THROWS_AS(Blake2sHasher(0), std::invalid_argument);
        REQUIRE_THROWS_AS(Blake2sHasher(33), std::invalid_argument);
    }
}
