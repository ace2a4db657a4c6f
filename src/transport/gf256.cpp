// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "transport/gf256.hpp"

#include <array>

namespace kadcast {
namespace transport {
namespace gf256 {

namespace {

constexpr unsigned POLYNOMIAL = 0x11D;

struct Tables {
  // exp is doubled so exp[log a + log b] never needs a modulo
  std::array<uint8_t, 512> exp{};
  std::array<uint8_t, 256> log{};
};

constexpr Tables BuildTables() {
  Tables t;
  unsigned x = 1;
  for (unsigned i = 0; i < 255; ++i) {
    t.exp[i] = static_cast<uint8_t>(x);
    t.log[x] = static_cast<uint8_t>(i);
    x <<= 1;
    if (x & 0x100) {
      x ^= POLYNOMIAL;
    }
  }
  for (unsigned i = 255; i < 512; ++i) {
    t.exp[i] = t.exp[i - 255];
  }
  return t;
}

constexpr Tables kTables = BuildTables();

}  // namespace

uint8_t Mul(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  return kTables.exp[kTables.log[a] + kTables.log[b]];
}

uint8_t Div(uint8_t a, uint8_t b) {
  if (a == 0) {
    return 0;
  }
  return kTables.exp[kTables.log[a] + 255 - kTables.log[b]];
}

uint8_t Inv(uint8_t a) {
  return kTables.exp[255 - kTables.log[a]];
}

void MulAddRegion(uint8_t* dst, const uint8_t* src, uint8_t c, size_t len) {
  if (c == 0) {
    return;
  }
  if (c == 1) {
    for (size_t i = 0; i < len; ++i) {
      dst[i] ^= src[i];
    }
    return;
  }

  std::array<uint8_t, 256> row{};
  const unsigned log_c = kTables.log[c];
  for (unsigned v = 1; v < 256; ++v) {
    row[v] = kTables.exp[kTables.log[v] + log_c];
  }
  for (size_t i = 0; i < len; ++i) {
    dst[i] ^= row[src[i]];
  }
}

void MulRegion(uint8_t* dst, uint8_t c, size_t len) {
  if (c == 1) {
    return;
  }
  std::array<uint8_t, 256> row{};
  if (c != 0) {
    const unsigned log_c = kTables.log[c];
    for (unsigned v = 1; v < 256; ++v) {
      row[v] = kTables.exp[kTables.log[v] + log_c];
    }
  }
  for (size_t i = 0; i < len; ++i) {
    dst[i] = row[dst[i]];
  }
}

}  // namespace gf256
}  // namespace transport
}  // namespace kadcast
