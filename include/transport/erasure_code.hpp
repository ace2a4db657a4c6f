// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace kadcast {
namespace transport {

/**
 * BlockCode - systematic Reed-Solomon code over GF(2^8) for one source block
 *
 * Symbols 0..k-1 are the source symbols themselves. Symbol k+r is the repair
 * symbol
 *     R_r = sum_j C[r][j] * S_j,   C[r][j] = 1 / ((k + r) XOR j)
 * i.e. a Cauchy matrix over the disjoint point sets {k..255} and {0..k-1}.
 * Every square submatrix of a Cauchy matrix is invertible, so any k distinct
 * symbols (source or repair) determine the block.
 *
 * Repair indexes are valid up to 255 regardless of how many the encoder
 * chose to send; the decoder needs nothing but k.
 */
class BlockCode {
public:
  using Symbol = std::vector<uint8_t>;

  // Throws std::invalid_argument unless 1 <= k < 256.
  explicit BlockCode(size_t source_symbols);

  size_t source_symbols() const { return k_; }
  size_t max_repair_symbols() const { return 256 - k_; }

  uint8_t coefficient(size_t repair_row, size_t source_column) const;

  // Repair symbol `repair_row` (symbol index k + repair_row).
  // All sources must have the same size.
  Symbol repair_symbol(const std::vector<Symbol>& sources, size_t repair_row) const;

  // Repair symbols 0..count-1.
  std::vector<Symbol> encode(const std::vector<Symbol>& sources, size_t count) const;

  // Reconstruct the k source symbols from any k distinct symbols, keyed by
  // symbol index. Returns std::nullopt if fewer than k usable symbols are given
  // or sizes disagree.
  std::optional<std::vector<Symbol>> decode(const std::map<uint16_t, Symbol>& symbols) const;

private:
  size_t k_;
};

}  // namespace transport
}  // namespace kadcast
