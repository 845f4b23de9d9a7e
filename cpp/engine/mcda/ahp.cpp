/*
===============================================================================
Fragment 2.4 — MCDA: AHP Weight Derivation (Implementation)
File: cpp/engine/mcda/ahp.cpp
===============================================================================

Weights use the normalized-column-sum approximation of the principal
eigenvector: normalize every column to sum 1, then average each row. For a
perfectly consistent matrix this IS the principal eigenvector. Under heavy
inconsistency it drifts slightly from what power iteration would return, and
some AHP literature expects the power method; for the n <= ~15 matrices this
engine accepts the difference is well below the 1/9..9 judgement resolution.

lambda_max is the mean of (M w)_i / w_i over the same approximate w.
Inconsistent matrices (CR > threshold) are reported, never rejected.
===============================================================================
*/

#include "engine/mcda/ahp.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <array>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace mcda {

namespace {

// Saaty's published RI for n = 1..15.
constexpr std::array<double, 15> kRandomIndex = {
    0.00, 0.00, 0.58, 0.90, 1.12, 1.24, 1.32, 1.41, 1.45, 1.49,
    1.51, 1.54, 1.56, 1.57, 1.59};

std::unordered_map<std::string, std::size_t> index_criteria(const std::vector<std::string>& criteria) {
  std::unordered_map<std::string, std::size_t> idx;
  idx.reserve(criteria.size());
  for (std::size_t i = 0; i < criteria.size(); ++i) {
    const bool inserted = idx.emplace(criteria[i], i).second;
    MCDA_REQUIRE(inserted, ErrorCode::InvalidInput, "duplicate criterion: " + criteria[i]);
  }
  return idx;
}

} // namespace

Matrix build_comparison_matrix(const std::vector<std::string>& criteria,
                               const std::vector<PairwiseComparison>& comparisons) {
  const std::size_t n = criteria.size();
  MCDA_REQUIRE(n > 0, ErrorCode::EmptyInput, "AHP requires at least one criterion");

  const auto idx = index_criteria(criteria);

  Matrix m(n, std::vector<double>(n, 1.0));
  std::vector<std::vector<bool>> filled(n, std::vector<bool>(n, false));

  for (const auto& c : comparisons) {
    auto ia = idx.find(c.criterion_a);
    auto ib = idx.find(c.criterion_b);
    MCDA_REQUIRE(ia != idx.end(), ErrorCode::InvalidInput,
                 "comparison references unknown criterion: " + c.criterion_a);
    MCDA_REQUIRE(ib != idx.end(), ErrorCode::InvalidInput,
                 "comparison references unknown criterion: " + c.criterion_b);
    MCDA_REQUIRE(ia->second != ib->second, ErrorCode::InvalidInput,
                 "cannot compare criterion with itself: " + c.criterion_a);
    MCDA_REQUIRE(is_finite(c.value) && c.value > 0.0, ErrorCode::InvalidInput,
                 "comparison value must be positive and finite: " + c.criterion_a + " vs " + c.criterion_b);

    std::size_t i = ia->second;
    std::size_t j = ib->second;
    double v = c.value;
    if (i > j) {
      std::swap(i, j);
      v = 1.0 / v;
    }

    if (filled[i][j]) {
      log(LogLevel::WARN, "AHP: duplicate comparison " + criteria[i] + " vs " + criteria[j] +
                              " ignored, keeping the first");
      continue;
    }
    filled[i][j] = true;
    m[i][j] = v;
    m[j][i] = 1.0 / v;
  }

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      MCDA_REQUIRE(filled[i][j], ErrorCode::IncompleteMatrix,
                   "missing pairwise comparison: " + criteria[i] + " vs " + criteria[j]);
    }
  }
  return m;
}

double random_index(std::size_t n) noexcept {
  if (n == 0) return 0.0;
  if (n > kRandomIndex.size()) return kRandomIndex.back();
  return kRandomIndex[n - 1];
}

AhpEngine::AhpEngine(ConsistencySettings cfg) : cfg_(cfg) {
  cfg_.validate_or_throw();
}

AhpResult AhpEngine::derive_weights(const std::vector<std::string>& criteria,
                                    const std::vector<PairwiseComparison>& comparisons) const {
  return derive_weights(criteria, build_comparison_matrix(criteria, comparisons));
}

AhpResult AhpEngine::derive_weights(const std::vector<std::string>& criteria, const Matrix& m) const {
  const std::size_t n = criteria.size();
  MCDA_REQUIRE(n > 0, ErrorCode::EmptyInput, "AHP requires at least one criterion");
  MCDA_REQUIRE(m.size() == n, ErrorCode::InvalidInput, "comparison matrix size does not match criteria");
  for (const auto& row : m) {
    MCDA_REQUIRE(row.size() == n, ErrorCode::InvalidInput, "comparison matrix is not square");
  }

  AhpResult out;

  if (n == 1) {
    out.weights[criteria[0]] = 1.0;
    out.eigenvector = {1.0};
    out.lambda_max = 1.0;
    return out;
  }

  // 1) Column sums
  std::vector<double> col_sum(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) col_sum[j] += m[i][j];
  }
  for (double s : col_sum) {
    MCDA_REQUIRE(is_finite(s) && s > 0.0, ErrorCode::NumericalFailure, "AHP column sum not positive");
  }

  // 2) Row means of the column-normalized matrix
  std::vector<double> w(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    double acc = 0.0;
    for (std::size_t j = 0; j < n; ++j) acc += m[i][j] / col_sum[j];
    w[i] = acc / static_cast<double>(n);
  }

  // 3) lambda_max = mean_i (M w)_i / w_i
  double ratio_sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    double mw = 0.0;
    for (std::size_t j = 0; j < n; ++j) mw += m[i][j] * w[j];
    MCDA_REQUIRE(is_finite(w[i]) && w[i] > 0.0, ErrorCode::NumericalFailure, "AHP weight not positive");
    ratio_sum += mw / w[i];
  }
  out.lambda_max = ratio_sum / static_cast<double>(n);
  MCDA_REQUIRE(is_finite(out.lambda_max), ErrorCode::NumericalFailure, "AHP lambda_max not finite");

  // 4) CI, 5) CR. lambda_max >= n for a positive reciprocal matrix, anything
  // below is rounding noise.
  if (n > 2) {
    const double ci = (out.lambda_max - static_cast<double>(n)) / static_cast<double>(n - 1);
    out.consistency_index = ci > 0.0 ? ci : 0.0;
  }
  out.consistency_ratio = safe_div(out.consistency_index, random_index(n), 0.0);

  // 6) Report, never block.
  out.is_consistent = out.consistency_ratio <= cfg_.max_consistency_ratio;

  out.eigenvector = w;
  for (std::size_t i = 0; i < n; ++i) out.weights[criteria[i]] = w[i];

  if (!out.is_consistent) {
    std::ostringstream ss;
    ss << "AHP: consistency ratio " << out.consistency_ratio << " exceeds "
       << cfg_.max_consistency_ratio << "; weights used as-is";
    log(LogLevel::INFO, ss.str());
  }
  return out;
}

std::vector<std::pair<std::string, std::string>> generate_comparison_pairs(const std::vector<std::string>& criteria) {
  std::vector<std::pair<std::string, std::string>> pairs;
  if (criteria.size() > 1) pairs.reserve(criteria.size() * (criteria.size() - 1) / 2);
  for (std::size_t i = 0; i < criteria.size(); ++i) {
    for (std::size_t j = i + 1; j < criteria.size(); ++j) {
      pairs.emplace_back(criteria[i], criteria[j]);
    }
  }
  return pairs;
}

std::string describe_comparison(double value) {
  if (!is_finite(value) || value <= 0.0) return "Invalid comparison value";
  if (value < 1.0 && !near(value, 1.0)) return "Reciprocal of " + describe_comparison(1.0 / value);

  static const char* const kScale[] = {
      "Equal importance",
      "Weak or slight importance",
      "Moderate importance",
      "Moderate plus importance",
      "Strong importance",
      "Strong plus importance",
      "Very strong importance",
      "Very, very strong importance",
      "Extreme importance"};

  for (int k = 1; k <= 9; ++k) {
    if (near(value, static_cast<double>(k), 1e-9, 1e-9)) return kScale[k - 1];
  }
  return "Intermediate importance";
}

std::map<std::string, double> equal_weights(const std::vector<std::string>& criteria) {
  std::map<std::string, double> out;
  if (criteria.empty()) return out;
  const double w = 1.0 / static_cast<double>(criteria.size());
  for (const auto& c : criteria) out[c] = w;
  return out;
}

} // namespace mcda
