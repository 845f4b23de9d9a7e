// ============================================================================
// Fragment 2.7.T — MCDA: Robustness Selftest
// File: cpp/engine/mcda/robustness_selftest.cpp
// ============================================================================
//
// Run: ./robustness_selftest   (non-zero exit on failure)
//
// ============================================================================

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/mcda/robustness.hpp"

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace {

using namespace mcda;
using namespace mcda::selftest;

Alternative site(const std::string& id, double cost, double capacity) {
    Alternative a;
    a.id = id;
    a.name = id;
    a.values["cost_usd"] = cost;
    a.values["capacity_kw"] = capacity;
    return a;
}

std::vector<Alternative> sites() {
    return {site("A", 100, 5), site("B", 200, 10), site("C", 150, 8)};
}

std::vector<Criterion> criteria(double w_cost = 0.5) {
    Criterion cost;
    cost.id = "cost_usd";
    cost.direction = Direction::Cost;
    cost.weight = w_cost;
    Criterion cap;
    cap.id = "capacity_kw";
    cap.direction = Direction::Benefit;
    cap.weight = 1.0 - w_cost;
    return {cost, cap};
}

EngineSettings mc_settings(std::size_t samples, std::uint64_t seed, double sigma_w, double sigma_d) {
    EngineSettings s = EngineSettings::defaults();
    s.monte_carlo.samples = samples;
    s.monte_carlo.seed = seed;
    s.monte_carlo.weight_sigma = sigma_w;
    s.monte_carlo.data_sigma = sigma_d;
    s.monte_carlo.top_k = 2;
    return s;
}

void test_spearman() {
    const std::vector<double> a{0.1, 0.5, 0.3, 0.9};
    const std::vector<double> rev{0.9, 0.1, 0.3, -0.2};
    expect_near(spearman_rank_correlation(a, a), 1.0, 1e-12, "spearman: identity is 1");
    expect_near(spearman_rank_correlation({1, 2, 3, 4}, {4, 3, 2, 1}), -1.0, 1e-12, "spearman: reversal is -1");
    expect_near(spearman_rank_correlation({2, 2, 2}, {5, 5, 5}), 1.0, 0.0, "spearman: both constant is 1");
    expect_near(spearman_rank_correlation({2, 2, 2}, {1, 2, 3}), 0.0, 0.0, "spearman: one constant is 0");
    const double r = spearman_rank_correlation(a, rev);
    expect_true(r >= -1.0 && r <= 1.0, "spearman: bounded");
    expect_throws_code([] { (void)spearman_rank_correlation({1, 2}, {1}); }, ErrorCode::InvalidInput,
                       "spearman: length mismatch");
}

void test_ranks_and_renormalize() {
    const std::vector<int> r = ranks_from_scores({0.2, 0.7, 0.2, 0.9});
    expect_true(r == std::vector<int>({3, 2, 4, 1}), "ranks: descending, ties in input order");

    std::vector<Criterion> c = criteria();
    c[0].weight = 2.0;
    c[1].weight = 6.0;
    renormalize_weights(c);
    expect_near(c[0].weight, 0.25, 1e-15, "renormalize: 2/8");
    expect_near(c[1].weight, 0.75, 1e-15, "renormalize: 6/8");

    c[0].weight = 0.0;
    c[1].weight = 0.0;
    expect_throws_code([&] { renormalize_weights(c); }, ErrorCode::InvalidInput, "renormalize: zero sum throws");
}

void test_sensitivity() {
    const RobustnessAnalyzer ra;
    const SensitivityReport rep = ra.weight_sensitivity(sites(), criteria());

    expect_true(rep.points.size() == 2 * 4, "sensitivity: criteria x factors scenarios");
    expect_eq_str(rep.base_top_alternative, "C", "sensitivity: base top is C");
    expect_true(rep.points.front().criterion_id == "cost_usd" && rep.points.back().criterion_id == "capacity_kw",
                "sensitivity: criterion-major order");

    bool sums_ok = true;
    bool bounded = true;
    for (const auto& p : rep.points) {
        double sum = 0.0;
        for (const auto& kv : p.weights) sum += kv.second;
        sums_ok = sums_ok && std::fabs(sum - 1.0) < 1e-12;
        bounded = bounded && p.rank_correlation >= -1.0 && p.rank_correlation <= 1.0 &&
                  p.mean_abs_score_change >= 0.0;
    }
    expect_true(sums_ok, "sensitivity: perturbed weights renormalized");
    expect_true(bounded, "sensitivity: metrics in range");

    const auto by_crit = rep.max_score_change_by_criterion();
    expect_true(by_crit.size() == 2 && by_crit.at("cost_usd") > 0.0, "sensitivity: per-criterion summary");
}

void test_sensitivity_single_criterion() {
    std::vector<Criterion> c = criteria(1.0);
    c.pop_back();
    const SensitivityReport rep = RobustnessAnalyzer().weight_sensitivity(sites(), c);
    bool unchanged = true;
    for (const auto& p : rep.points) {
        unchanged = unchanged && p.mean_abs_score_change < 1e-12 && !p.top_changed;
    }
    expect_true(unchanged, "sensitivity: lone criterion cannot move the ranking");
}

void test_monte_carlo_determinism() {
    const RobustnessAnalyzer ra(mc_settings(300, 42, 0.10, 0.05));
    const MonteCarloReport r1 = ra.monte_carlo(sites(), criteria());
    const MonteCarloReport r2 = ra.monte_carlo(sites(), criteria());

    bool same = r1.robust_ranking == r2.robust_ranking;
    for (std::size_t i = 0; same && i < r1.alternatives.size(); ++i) {
        same = r1.alternatives[i].mean_score == r2.alternatives[i].mean_score &&
               r1.alternatives[i].std_score == r2.alternatives[i].std_score &&
               r1.alternatives[i].p_rank1 == r2.alternatives[i].p_rank1;
    }
    expect_true(same, "monte carlo: same seed => identical report");
    expect_true(r1.samples_ok + r1.samples_failed == r1.samples_requested, "monte carlo: every draw accounted");

    double p1 = 0.0;
    bool ordered = true;
    for (const auto& a : r1.alternatives) {
        p1 += a.p_rank1;
        ordered = ordered && a.p025 <= a.mean_score && a.mean_score <= a.p975 && a.mean_rank >= 1.0 &&
                  a.mean_rank <= 3.0 && a.p_top_k >= a.p_rank1;
    }
    expect_near(p1, 1.0, 1e-12, "monte carlo: rank-1 probabilities sum to 1");
    expect_true(ordered, "monte carlo: per-alternative stats consistent");

    const RobustnessAnalyzer other(mc_settings(300, 43, 0.10, 0.05));
    const MonteCarloReport r3 = other.monte_carlo(sites(), criteria());
    expect_true(r3.alternatives[0].mean_score != r1.alternatives[0].mean_score, "monte carlo: seed matters");
}

void test_monte_carlo_zero_noise() {
    const RobustnessAnalyzer ra(mc_settings(50, 7, 0.0, 0.0));
    const MonteCarloReport r = ra.monte_carlo(sites(), criteria());
    expect_true(r.robust_ranking == std::vector<std::string>({"C", "A", "B"}), "monte carlo: no noise keeps C, A, B");
    expect_near(r.alternatives[2].p_rank1, 1.0, 0.0, "monte carlo: no noise, C always first");
    expect_near(r.alternatives[2].std_score, 0.0, 0.0, "monte carlo: no noise, zero spread");
}

void test_fuzzy() {
    std::map<std::string, TriangularWeight> fw;
    fw["cost_usd"] = TriangularWeight{0.3, 0.5, 0.7};
    fw["capacity_kw"] = TriangularWeight{0.2, 0.5, 0.6};

    const FuzzyReport rep = RobustnessAnalyzer().fuzzy_ranges(sites(), criteria(), fw);
    double sum = 0.0;
    for (const auto& kv : rep.crisp_weights) sum += kv.second;
    expect_near(sum, 1.0, 1e-12, "fuzzy: crisp weights renormalized");
    expect_true(rep.crisp_ranking.size() == 3, "fuzzy: crisp ranking present");

    bool bracketed = true;
    for (const auto& r : rep.ranges) bracketed = bracketed && r.min_score <= r.crisp_score && r.crisp_score <= r.max_score;
    expect_true(bracketed, "fuzzy: min <= crisp <= max");

    fw.erase("capacity_kw");
    expect_throws_code([&] { (void)RobustnessAnalyzer().fuzzy_ranges(sites(), criteria(), fw); },
                       ErrorCode::InvalidInput, "fuzzy: missing triangle");
    fw["capacity_kw"] = TriangularWeight{0.6, 0.5, 0.7};
    expect_throws_code([&] { (void)RobustnessAnalyzer().fuzzy_ranges(sites(), criteria(), fw); },
                       ErrorCode::InvalidInput, "fuzzy: low > mid rejected");
}

void test_diagnostics() {
    std::vector<Alternative> alts = sites();
    alts[0].values["pv_npv"] = -100.0;
    alts[1].values["pv_npv"] = 100.0;
    alts[2].values["pv_npv"] = 0.0;
    std::vector<Criterion> c = criteria();
    Criterion npv;
    npv.id = "pv_npv";
    npv.weight = 0.0;
    c.push_back(npv);

    const Diagnostics d = RobustnessAnalyzer().diagnostics(alts, c);
    expect_true(d.criteria.size() == 3, "diagnostics: one entry per criterion");
    expect_near(d.criteria[0].mean, 150.0, 1e-12, "diagnostics: cost mean");
    expect_true(d.criteria[2].stddev > 0.0, "diagnostics: npv spread");
    expect_near(d.criteria[2].coefficient_of_variation, 0.0, 0.0, "diagnostics: CV is 0 when mean is 0");
    expect_true(d.scores.min <= d.scores.mean && d.scores.mean <= d.scores.max, "diagnostics: score summary");
    expect_near(d.scores.range, d.scores.max - d.scores.min, 0.0, "diagnostics: range");
}

void test_invalid_settings() {
    EngineSettings s = EngineSettings::defaults();
    s.sensitivity.weight_factors.clear();
    expect_throws_code([&] { RobustnessAnalyzer ra(s); (void)ra; }, ErrorCode::InvalidConfig,
                       "settings: empty factor list rejected");
}

} // namespace

int main() {
    mcda::set_log_level(mcda::LogLevel::ERROR);

    test_spearman();
    test_ranks_and_renormalize();
    test_sensitivity();
    test_sensitivity_single_criterion();
    test_monte_carlo_determinism();
    test_monte_carlo_zero_noise();
    test_fuzzy();
    test_diagnostics();
    test_invalid_settings();
    return mcda::selftest::finish();
}
