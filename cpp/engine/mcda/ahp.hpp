/*
===============================================================================
Fragment 2.4 — MCDA: AHP Weight Derivation (Pairwise Matrix -> Weights + CR)
File: cpp/engine/mcda/ahp.hpp
===============================================================================
*/

#pragma once

#include "engine/core/settings.hpp"
#include "engine/mcda/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mcda {

using Matrix = std::vector<std::vector<double>>;

// Reciprocal n x n comparison matrix in `criteria` order.
//   M[i][i] = 1; M[i][j] = supplied value for i<j; M[j][i] = 1 / M[i][j].
// A comparison supplied as (b, a) for an upper-triangle pair (a, b) is stored
// as 1/value. Only the first comparison of an unordered pair is used.
// Throws McdaError:
//   EmptyInput        no criteria
//   InvalidInput      duplicate criterion, unknown id, self comparison, value <= 0 or non-finite
//   IncompleteMatrix  some pair (i, j), i<j, has no comparison
Matrix build_comparison_matrix(const std::vector<std::string>& criteria,
                               const std::vector<PairwiseComparison>& comparisons);

// Saaty random index for an n x n matrix. n > 15 uses RI(15).
double random_index(std::size_t n) noexcept;

class AhpEngine final {
public:
  explicit AhpEngine(ConsistencySettings cfg = {});

  AhpResult derive_weights(const std::vector<std::string>& criteria,
                           const std::vector<PairwiseComparison>& comparisons) const;

  // Weights + consistency from an already-built reciprocal matrix.
  AhpResult derive_weights(const std::vector<std::string>& criteria, const Matrix& m) const;

  const ConsistencySettings& settings() const noexcept { return cfg_; }

private:
  ConsistencySettings cfg_;
};

// Every (a, b) pair, a before b in `criteria` order: n(n-1)/2 entries.
std::vector<std::pair<std::string, std::string>> generate_comparison_pairs(const std::vector<std::string>& criteria);

// Saaty verbal scale ("Moderate importance", "Reciprocal of ...").
std::string describe_comparison(double value);

// 1/n for every criterion.
std::map<std::string, double> equal_weights(const std::vector<std::string>& criteria);

} // namespace mcda
