#pragma once
/*
================================================================================
Fragment 2.0 — MCDA: Data Model
FILE: cpp/engine/mcda/types.hpp

Purpose:
  Value objects shared by every MCDA module. All of them are created fresh per
  analysis request and never mutated after the engine hands them back.

Rules:
  - Direction is a closed enum; there is no "unknown" direction.
  - Weights live on Criterion; per-site values live on Alternative.
  - Ordering: every list keeps caller order (criteria selection order,
    alternative input order). Maps are std::map so output is deterministic.

Note:
  This header defines *types only*. Computation lives in ahp.*, topsis.*,
  request_validator.*, orchestrator.*.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcda {

enum class Direction : std::uint8_t {
  Benefit = 0,  // higher raw value preferred
  Cost = 1      // lower raw value preferred
};

enum class WeightingMethod : std::uint8_t {
  Direct = 0,
  Ahp = 1
};

enum class AnalysisStatus : std::uint8_t {
  Success = 0,
  Failed = 1
};

// Stage at which a failed analysis stopped.
enum class AnalysisStage : std::uint8_t {
  None = 0,
  Validate = 1,
  ResolveWeights = 2,
  Rank = 3
};

const char* to_string(Direction d) noexcept;
const char* to_string(WeightingMethod m) noexcept;
const char* to_string(AnalysisStatus s) noexcept;
const char* to_string(AnalysisStage s) noexcept;

bool parse_direction(const std::string& s, Direction& out) noexcept;

// Accepts "direct" / "ahp" and the legacy "TOPSIS_W" / "TOPSIS_AHP".
bool parse_weighting_method(const std::string& s, WeightingMethod& out) noexcept;

struct Criterion final {
  std::string id;
  std::string name;
  Direction direction = Direction::Benefit;
  double weight = 0.0;  // [0,1]; weights of one analysis sum to 1
  std::string unit;
};

struct Alternative final {
  std::string id;
  std::string name;
  std::map<std::string, double> values;  // criterion id -> raw value

  // nullopt when the criterion is absent.
  std::optional<double> value_of(const std::string& criterion_id) const {
    auto it = values.find(criterion_id);
    if (it == values.end()) return std::nullopt;
    return it->second;
  }
};

// "criterion_a is `value` times as important as criterion_b" (Saaty 1/9..9).
struct PairwiseComparison final {
  std::string criterion_a;
  std::string criterion_b;
  double value = 1.0;
};

struct AhpResult final {
  std::map<std::string, double> weights;
  std::vector<double> eigenvector;  // same weights, criterion order
  double lambda_max = 0.0;
  double consistency_index = 0.0;
  double consistency_ratio = 0.0;
  bool is_consistent = true;
};

struct TopsisResult final {
  std::string alternative_id;
  std::string name;
  double score = 0.0;  // closeness coefficient, [0,1]
  int rank = 0;        // 1-based
  double distance_to_best = 0.0;
  double distance_to_worst = 0.0;
  std::size_t input_index = 0;
};

struct AnalysisRequest final {
  std::vector<std::string> alternative_ids;
  std::vector<std::string> criteria;
  WeightingMethod method = WeightingMethod::Direct;
  std::map<std::string, double> weights;                  // direct only
  std::vector<PairwiseComparison> pairwise_comparisons;   // ahp only
};

struct AnalysisResponse final {
  WeightingMethod method = WeightingMethod::Direct;
  AnalysisStatus status = AnalysisStatus::Failed;
  AnalysisStage failed_stage = AnalysisStage::None;

  std::vector<TopsisResult> ranking;
  std::map<std::string, double> resolved_weights;
  std::vector<Criterion> criteria;
  std::vector<Alternative> alternatives;
  std::optional<AhpResult> ahp;

  // Empty on success. Non-empty implies ranking is empty.
  std::vector<std::string> validation_errors;

  bool ok() const noexcept { return status == AnalysisStatus::Success; }
};

}  // namespace mcda
