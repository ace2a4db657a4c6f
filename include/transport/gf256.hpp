// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace kadcast {
namespace transport {
namespace gf256 {

// Arithmetic in GF(2^8) with the reduction polynomial x^8+x^4+x^3+x^2+1 (0x11D).
// Addition is XOR.

uint8_t Mul(uint8_t a, uint8_t b);

// a / b, b != 0
uint8_t Div(uint8_t a, uint8_t b);

// 1 / a, a != 0
uint8_t Inv(uint8_t a);

// dst[i] ^= c * src[i]
void MulAddRegion(uint8_t* dst, const uint8_t* src, uint8_t c, size_t len);

// dst[i] = c * dst[i]
void MulRegion(uint8_t* dst, uint8_t c, size_t len);

}  // namespace gf256
}  // namespace transport
}  // namespace kadcast
