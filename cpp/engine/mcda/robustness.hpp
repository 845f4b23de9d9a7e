// ============================================================================
// Fragment 2.7 — MCDA: Robustness (Weight Sensitivity, Monte Carlo, Fuzzy)
// File: cpp/engine/mcda/robustness.hpp
// ============================================================================
//
// Everything here reruns TOPSIS on perturbed inputs of an already validated
// analysis (AnalysisResponse::alternatives / ::criteria). Nothing mutates the
// inputs. Monte Carlo is seeded: equal settings => bit-identical reports.
//
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "engine/mcda/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mcda {

// ---------------------------- Weight sensitivity ----------------------------

struct SensitivityPoint final {
    std::string criterion_id;
    double factor = 1.0;                      // applied to criterion_id's weight
    std::map<std::string, double> weights;    // after renormalization
    std::vector<double> scores;               // input order
    double mean_abs_score_change = 0.0;
    double rank_correlation = 1.0;            // Spearman vs. base ranking
    std::string top_alternative;
    bool top_changed = false;
};

struct SensitivityReport final {
    std::vector<double> base_scores;          // input order
    std::string base_top_alternative;
    std::vector<SensitivityPoint> points;     // criterion-major, factor-minor

    // Largest mean_abs_score_change per criterion.
    std::map<std::string, double> max_score_change_by_criterion() const;
};

// ---------------------------- Monte Carlo -----------------------------------

struct McAlternativeStats final {
    std::string alternative_id;
    std::string name;
    double mean_score = 0.0;
    double std_score = 0.0;
    double p025 = 0.0;
    double p975 = 0.0;
    double mean_rank = 0.0;
    double p_rank1 = 0.0;
    double p_top_k = 0.0;
};

struct MonteCarloReport final {
    std::size_t samples_requested = 0;
    std::size_t samples_ok = 0;
    std::size_t samples_failed = 0;
    std::uint64_t seed = 0;
    std::size_t top_k = 0;

    std::vector<McAlternativeStats> alternatives;   // input order
    std::vector<std::string> robust_ranking;        // ids by mean score
};

// ---------------------------- Fuzzy weights ---------------------------------

struct TriangularWeight final {
    double low = 0.0;
    double mid = 0.0;
    double high = 0.0;

    double centroid() const noexcept { return (low + mid + high) / 3.0; }
};

struct FuzzyAlternativeRange final {
    std::string alternative_id;
    double crisp_score = 0.0;
    double min_score = 0.0;
    double max_score = 0.0;
};

struct FuzzyReport final {
    std::map<std::string, double> crisp_weights;    // renormalized centroids
    std::vector<TopsisResult> crisp_ranking;
    std::vector<FuzzyAlternativeRange> ranges;      // input order
};

// ---------------------------- Diagnostics -----------------------------------

struct CriterionDispersion final {
    std::string criterion_id;
    double mean = 0.0;
    double stddev = 0.0;
    double coefficient_of_variation = 0.0;  // 0 when mean == 0
};

struct ScoreSummary final {
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;
};

struct Diagnostics final {
    std::vector<CriterionDispersion> criteria;
    ScoreSummary scores;
};

// ---------------------------- Analyzer --------------------------------------

class RobustnessAnalyzer final {
public:
    explicit RobustnessAnalyzer(EngineSettings settings = EngineSettings::defaults());

    SensitivityReport weight_sensitivity(const std::vector<Alternative>& alternatives,
                                         const std::vector<Criterion>& criteria) const;

    // Throws McdaError(NumericalFailure) when every draw fails.
    MonteCarloReport monte_carlo(const std::vector<Alternative>& alternatives,
                                 const std::vector<Criterion>& criteria) const;

    // `fuzzy` must hold a triangle for every criterion.
    FuzzyReport fuzzy_ranges(const std::vector<Alternative>& alternatives,
                             const std::vector<Criterion>& criteria,
                             const std::map<std::string, TriangularWeight>& fuzzy) const;

    Diagnostics diagnostics(const std::vector<Alternative>& alternatives,
                            const std::vector<Criterion>& criteria) const;

    const EngineSettings& settings() const noexcept { return settings_; }

private:
    EngineSettings settings_;
};

// Spearman rank correlation (average ranks for ties). Returns 1 for fewer than
// two samples or when both series are constant, 0 when only one is.
double spearman_rank_correlation(const std::vector<double>& a, const std::vector<double>& b);

// 1-based ranks for scores (descending, ties in input order).
std::vector<int> ranks_from_scores(const std::vector<double>& scores);

// Scale every weight by 1/sum. Throws InvalidInput when the sum is not positive.
void renormalize_weights(std::vector<Criterion>& criteria);

} // namespace mcda
