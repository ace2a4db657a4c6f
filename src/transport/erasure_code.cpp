// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "transport/erasure_code.hpp"

#include "transport/gf256.hpp"

#include <stdexcept>
#include <utility>

namespace kadcast {
namespace transport {

BlockCode::BlockCode(size_t source_symbols) : k_(source_symbols) {
  if (k_ == 0 || k_ >= 256) {
    throw std::invalid_argument("block source symbol count must be in 1..255");
  }
}

uint8_t BlockCode::coefficient(size_t repair_row, size_t source_column) const {
  const auto x = static_cast<uint8_t>(k_ + repair_row);
  const auto y = static_cast<uint8_t>(source_column);
  return gf256::Inv(static_cast<uint8_t>(x ^ y));
}

BlockCode::Symbol BlockCode::repair_symbol(const std::vector<Symbol>& sources, size_t repair_row) const {
  const size_t symbol_size = sources.empty() ? 0 : sources.front().size();
  Symbol out(symbol_size, 0);
  for (size_t j = 0; j < k_ && j < sources.size(); ++j) {
    gf256::MulAddRegion(out.data(), sources[j].data(), coefficient(repair_row, j), symbol_size);
  }
  return out;
}

std::vector<BlockCode::Symbol> BlockCode::encode(const std::vector<Symbol>& sources, size_t count) const {
  if (sources.size() != k_) {
    throw std::invalid_argument("BlockCode::encode: wrong number of source symbols");
  }
  if (count > max_repair_symbols()) {
    throw std::invalid_argument("BlockCode::encode: too many repair symbols requested");
  }
  std::vector<Symbol> repair;
  repair.reserve(count);
  for (size_t r = 0; r < count; ++r) {
    repair.push_back(repair_symbol(sources, r));
  }
  return repair;
}

std::optional<std::vector<BlockCode::Symbol>> BlockCode::decode(const std::map<uint16_t, Symbol>& symbols) const {
  if (symbols.size() < k_) {
    return std::nullopt;
  }
  const size_t symbol_size = symbols.begin()->second.size();

  std::vector<Symbol> sources(k_);
  std::vector<bool> have(k_, false);
  std::vector<std::pair<size_t, const Symbol*>> repairs;  // (repair row, data)

  for (const auto& [index, data] : symbols) {
    if (data.size() != symbol_size || index >= 256) {
      return std::nullopt;
    }
    if (index < k_) {
      sources[index] = data;
      have[index] = true;
    } else {
      repairs.emplace_back(index - k_, &data);
    }
  }

  std::vector<size_t> missing;
  for (size_t j = 0; j < k_; ++j) {
    if (!have[j]) {
      missing.push_back(j);
    }
  }
  if (missing.empty()) {
    return sources;
  }
  if (repairs.size() < missing.size()) {
    return std::nullopt;
  }

  // Solve A * x = rhs where x are the missing sources, A[i][c] = C[row_i][missing_c]
  // and rhs_i is the repair symbol with the known sources' contribution removed.
  const size_t e = missing.size();
  std::vector<std::vector<uint8_t>> a(e, std::vector<uint8_t>(e));
  std::vector<Symbol> rhs(e);
  for (size_t i = 0; i < e; ++i) {
    const size_t row = repairs[i].first;
    rhs[i] = *repairs[i].second;
    for (size_t j = 0; j < k_; ++j) {
      if (have[j]) {
        gf256::MulAddRegion(rhs[i].data(), sources[j].data(), coefficient(row, j), symbol_size);
      }
    }
    for (size_t c = 0; c < e; ++c) {
      a[i][c] = coefficient(row, missing[c]);
    }
  }

  // Gauss-Jordan elimination, applying every row operation to rhs as well.
  for (size_t col = 0; col < e; ++col) {
    size_t pivot = col;
    while (pivot < e && a[pivot][col] == 0) {
      ++pivot;
    }
    if (pivot == e) {
      return std::nullopt;
    }
    if (pivot != col) {
      std::swap(a[pivot], a[col]);
      std::swap(rhs[pivot], rhs[col]);
    }

    const uint8_t inv = gf256::Inv(a[col][col]);
    gf256::MulRegion(a[col].data(), inv, e);
    gf256::MulRegion(rhs[col].data(), inv, symbol_size);

    for (size_t r = 0; r < e; ++r) {
      if (r == col || a[r][col] == 0) {
        continue;
      }
      const uint8_t factor = a[r][col];
      gf256::MulAddRegion(a[r].data(), a[col].data(), factor, e);
      gf256::MulAddRegion(rhs[r].data(), rhs[col].data(), factor, symbol_size);
    }
  }

  for (size_t c = 0; c < e; ++c) {
    sources[missing[c]] = std::move(rhs[c]);
  }
  return sources;
}

}  // namespace transport
}  // namespace kadcast
