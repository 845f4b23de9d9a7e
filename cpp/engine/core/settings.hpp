#pragma once
/*
================================================================================
Fragment 1.4 — Core: Engine Settings (Validated)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every tolerance and threshold the MCDA engine applies
    (request validation, AHP consistency, robustness sampling) into a single
    validated object.
  - Two analyses run with equal settings and equal inputs must produce
    bit-identical output.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Defaults are the published conventions (Saaty CR <= 0.10, 1..9 scale).
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

namespace mcda {

// ----------------------------- Validation ------------------------------------
struct ValidationSettings {
  std::size_t min_alternatives = 2;
  std::size_t min_criteria = 1;

  // Direct weights must sum to 1 within this tolerance.
  double weight_sum_tolerance = 1e-3;

  // Saaty's RI table is only published up to 15.
  std::size_t max_ahp_criteria = 15;

  // Saaty 1..9 scale and its reciprocals.
  double min_comparison_value = 1.0 / 9.0;
  double max_comparison_value = 9.0;

  void validate_or_throw() const {
    MCDA_REQUIRE(min_alternatives >= 1, ErrorCode::InvalidConfig,
                 "ValidationSettings: min_alternatives must be >= 1");
    MCDA_REQUIRE(min_criteria >= 1, ErrorCode::InvalidConfig,
                 "ValidationSettings: min_criteria must be >= 1");
    MCDA_REQUIRE(is_finite(weight_sum_tolerance) && weight_sum_tolerance > 0.0 && weight_sum_tolerance < 0.5,
                 ErrorCode::InvalidConfig, "ValidationSettings: weight_sum_tolerance outside sane bounds");
    MCDA_REQUIRE(max_ahp_criteria >= 1 && max_ahp_criteria <= 64, ErrorCode::InvalidConfig,
                 "ValidationSettings: max_ahp_criteria outside sane bounds");
    MCDA_REQUIRE(is_finite(min_comparison_value) && is_finite(max_comparison_value) &&
                     min_comparison_value > 0.0 && min_comparison_value <= 1.0 && max_comparison_value >= 1.0,
                 ErrorCode::InvalidConfig, "ValidationSettings: comparison bounds invalid");
  }
};

// ----------------------------- Consistency -----------------------------------
struct ConsistencySettings {
  // Saaty's accepted threshold. Above it the matrix is reported inconsistent,
  // the weights are still used.
  double max_consistency_ratio = 0.10;

  void validate_or_throw() const {
    MCDA_REQUIRE(is_finite(max_consistency_ratio) && max_consistency_ratio > 0.0 && max_consistency_ratio <= 1.0,
                 ErrorCode::InvalidConfig, "ConsistencySettings: max_consistency_ratio must be (0,1]");
  }
};

// ----------------------------- Sensitivity -----------------------------------
struct SensitivitySettings {
  // Multiplicative factors applied to one weight at a time (+-20%).
  std::vector<double> weight_factors{0.8, 0.9, 1.1, 1.2};

  void validate_or_throw() const {
    MCDA_REQUIRE(!weight_factors.empty(), ErrorCode::InvalidConfig, "SensitivitySettings: weight_factors empty");
    for (double f : weight_factors) {
      MCDA_REQUIRE(is_finite(f) && f > 0.0 && f <= 10.0, ErrorCode::InvalidConfig,
                   "SensitivitySettings: weight factor outside (0,10]");
    }
  }
};

// ----------------------------- Monte Carlo -----------------------------------
struct MonteCarloSettings {
  std::size_t samples = 1000;

  // Random seed to ensure deterministic runs.
  std::uint64_t seed = 1;

  // Relative std-dev of the multiplicative noise on weights and on values.
  double weight_sigma = 0.10;
  double data_sigma = 0.05;

  // "Top-k" probability reported per alternative.
  std::size_t top_k = 3;

  void validate_or_throw() const {
    MCDA_REQUIRE(samples >= 1 && samples <= 1'000'000, ErrorCode::InvalidConfig,
                 "MonteCarloSettings: samples outside sane bounds");
    MCDA_REQUIRE(is_finite(weight_sigma) && weight_sigma >= 0.0 && weight_sigma <= 1.0, ErrorCode::InvalidConfig,
                 "MonteCarloSettings: weight_sigma must be [0,1]");
    MCDA_REQUIRE(is_finite(data_sigma) && data_sigma >= 0.0 && data_sigma <= 1.0, ErrorCode::InvalidConfig,
                 "MonteCarloSettings: data_sigma must be [0,1]");
    MCDA_REQUIRE(top_k >= 1, ErrorCode::InvalidConfig, "MonteCarloSettings: top_k must be >= 1");
  }
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  ValidationSettings validation;
  ConsistencySettings consistency;
  SensitivitySettings sensitivity;
  MonteCarloSettings monte_carlo;

  void validate_or_throw() const {
    validation.validate_or_throw();
    consistency.validate_or_throw();
    sensitivity.validate_or_throw();
    monte_carlo.validate_or_throw();
  }

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

}  // namespace mcda
