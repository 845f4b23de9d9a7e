/*
  Fragment 2.6.T — Analyzer Selftest

  Checks the Validate -> Resolve Weights -> Rank flow end to end:
    1) Direct weights on the 3-site example: success, C > A > B.
    2) AHP weights: diagnostics surfaced, inconsistency does not block.
    3) Validation failure: errors only, never a partial ranking.
    4) Engine failures come back as a single prefixed string.
    5) One Analyzer shared by several threads gives identical answers.

  Run: ./orchestrator_selftest   (non-zero exit on failure)
*/

#include <cmath>
#include <string>
#include <thread>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/mcda/orchestrator.hpp"

namespace {

using namespace mcda;
using namespace mcda::selftest;

Alternative site(const std::string& id, double cost, double capacity, double npv = 0.0) {
  Alternative a;
  a.id = id;
  a.name = "Site " + id;
  a.values["cost_usd"] = cost;
  a.values["capacity_kw"] = capacity;
  a.values["pv_npv"] = npv;
  return a;
}

std::vector<Alternative> three_sites() {
  return {site("A", 100, 5, 1000), site("B", 200, 10, 4000), site("C", 150, 8, 2500)};
}

AnalysisRequest direct_request() {
  AnalysisRequest r;
  r.alternative_ids = {"A", "B", "C"};
  r.criteria = {"cost_usd", "capacity_kw"};
  r.method = WeightingMethod::Direct;
  r.weights = {{"cost_usd", 0.5}, {"capacity_kw", 0.5}};
  return r;
}

PairwiseComparison cmp(const std::string& a, const std::string& b, double v) {
  PairwiseComparison pc;
  pc.criterion_a = a;
  pc.criterion_b = b;
  pc.value = v;
  return pc;
}

void test_direct_round_trip() {
  const Analyzer analyzer;
  const AnalysisResponse r = analyzer.analyze(direct_request(), three_sites());

  expect_true(r.ok(), "direct: success");
  expect_true(r.validation_errors.empty(), "direct: no errors");
  expect_true(r.ranking.size() == 3, "direct: three ranked");
  if (r.ranking.size() == 3) {
    expect_eq_str(r.ranking[0].alternative_id + r.ranking[1].alternative_id + r.ranking[2].alternative_id, "CAB",
                  "direct: ranking C, A, B");
  }
  expect_true(!r.ahp.has_value(), "direct: no AHP diagnostics");
  expect_true(r.resolved_weights.size() == 2 && r.resolved_weights.at("cost_usd") == 0.5,
              "direct: weights copied as supplied");
  expect_true(r.criteria.size() == 2 && r.criteria[0].direction == Direction::Cost &&
                  r.criteria[1].direction == Direction::Benefit,
              "direct: directions come from the catalog");
  expect_eq_str(r.criteria[1].name, "Capacity", "direct: catalog name attached");
}

void test_ahp_equal_judgement_matches_direct() {
  AnalysisRequest req = direct_request();
  req.method = WeightingMethod::Ahp;
  req.weights.clear();
  req.pairwise_comparisons = {cmp("cost_usd", "capacity_kw", 1.0)};

  const Analyzer analyzer;
  const AnalysisResponse a = analyzer.analyze(req, three_sites());
  const AnalysisResponse d = analyzer.analyze(direct_request(), three_sites());

  expect_true(a.ok(), "ahp 1:1: success");
  expect_true(a.ahp.has_value() && a.ahp->consistency_ratio == 0.0 && a.ahp->is_consistent,
              "ahp 1:1: diagnostics present, CR 0");
  bool same = a.ranking.size() == d.ranking.size();
  for (std::size_t i = 0; same && i < a.ranking.size(); ++i) {
    same = a.ranking[i].alternative_id == d.ranking[i].alternative_id &&
           std::fabs(a.ranking[i].score - d.ranking[i].score) < 1e-12;
  }
  expect_true(same, "ahp 1:1: identical to direct 0.5/0.5");
}

void test_ahp_inconsistent_still_ranks() {
  AnalysisRequest req;
  req.alternative_ids = {"A", "B", "C"};
  req.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  req.method = WeightingMethod::Ahp;
  req.pairwise_comparisons = {cmp("cost_usd", "capacity_kw", 9.0), cmp("capacity_kw", "pv_npv", 9.0),
                              cmp("cost_usd", "pv_npv", 1.0 / 9.0)};

  const AnalysisResponse r = Analyzer().analyze(req, three_sites());
  expect_true(r.ok(), "ahp cyclic: still succeeds");
  expect_true(r.ahp.has_value() && !r.ahp->is_consistent, "ahp cyclic: reported inconsistent");
  expect_true(r.ranking.size() == 3, "ahp cyclic: full ranking");
}

void test_validation_failure() {
  AnalysisRequest req = direct_request();
  req.weights["cost_usd"] = 0.4;

  const AnalysisResponse r = Analyzer().analyze(req, three_sites());
  expect_true(!r.ok() && r.failed_stage == AnalysisStage::Validate, "bad weights: failed at validate");
  expect_true(r.ranking.empty(), "bad weights: no ranking");
  expect_true(r.validation_errors.size() == 1, "bad weights: one error");
  if (!r.validation_errors.empty()) {
    expect_eq_str(r.validation_errors[0], "Weights must sum to 1, but sum to 0.900", "bad weights: message");
  }
}

void test_ahp_insufficient() {
  AnalysisRequest req;
  req.alternative_ids = {"A", "B", "C"};
  req.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  req.method = WeightingMethod::Ahp;
  req.pairwise_comparisons = {cmp("cost_usd", "capacity_kw", 3.0)};

  const AnalysisResponse r = Analyzer().analyze(req, three_sites());
  expect_true(r.ranking.empty(), "ahp 1 of 3: no ranking");
  expect_true(r.validation_errors.size() == 1, "ahp 1 of 3: exactly one error");
  if (!r.validation_errors.empty()) {
    expect_eq_str(r.validation_errors[0], "Insufficient pairwise comparisons. Expected 3, got 1",
                  "ahp 1 of 3: message");
  }
}

void test_ahp_engine_failure() {
  // Enough comparisons by count, but (capacity_kw, pv_npv) is never given.
  AnalysisRequest req;
  req.alternative_ids = {"A", "B", "C"};
  req.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  req.method = WeightingMethod::Ahp;
  req.pairwise_comparisons = {cmp("cost_usd", "capacity_kw", 3.0), cmp("capacity_kw", "cost_usd", 1.0 / 3.0),
                              cmp("cost_usd", "pv_npv", 2.0)};

  const AnalysisResponse r = Analyzer().analyze(req, three_sites());
  expect_true(!r.ok() && r.failed_stage == AnalysisStage::ResolveWeights, "ahp gap: failed resolving weights");
  expect_true(r.ranking.empty() && r.validation_errors.size() == 1, "ahp gap: single error, no ranking");
  if (!r.validation_errors.empty()) {
    expect_true(r.validation_errors[0].rfind("AHP analysis failed: ", 0) == 0, "ahp gap: prefixed message");
  }
}

void test_topsis_failure() {
  std::vector<Alternative> rows = three_sites();
  for (auto& a : rows) a.values["cost_usd"] = 120.0;

  const AnalysisResponse r = Analyzer().analyze(direct_request(), rows);
  expect_true(!r.ok() && r.failed_stage == AnalysisStage::Rank, "constant column: failed at rank");
  expect_true(r.ranking.empty() && r.validation_errors.size() == 1, "constant column: single error, no ranking");
  if (!r.validation_errors.empty()) {
    expect_eq_str(r.validation_errors[0],
                  "TOPSIS analysis failed: criterion cost_usd has identical values for every alternative",
                  "constant column: message");
  }
}

void test_selection_order() {
  AnalysisRequest req = direct_request();
  req.alternative_ids = {"C", "A"};
  const AnalysisResponse r = Analyzer().analyze(req, three_sites());
  expect_true(r.ok() && r.ranking.size() == 2, "subset: only selected alternatives ranked");
  expect_true(r.alternatives.size() == 2 && r.alternatives[0].id == "C" && r.alternatives[1].id == "A",
              "subset: rows kept in selection order");
}

void test_invalid_settings() {
  EngineSettings s = EngineSettings::defaults();
  s.consistency.max_consistency_ratio = -1.0;
  expect_throws_code([&] { Analyzer a(s); (void)a; }, ErrorCode::InvalidConfig, "settings: bad CR threshold rejected");
}

void test_shared_across_threads() {
  const Analyzer analyzer;
  const AnalysisRequest req = direct_request();
  const std::vector<Alternative> rows = three_sites();
  const AnalysisResponse ref = analyzer.analyze(req, rows);

  std::vector<AnalysisResponse> out(4);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < out.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int k = 0; k < 50; ++k) out[t] = analyzer.analyze(req, rows);
    });
  }
  for (auto& th : threads) th.join();

  bool same = true;
  for (const auto& r : out) {
    if (r.ranking.size() != ref.ranking.size()) {
      same = false;
      break;
    }
    for (std::size_t i = 0; i < r.ranking.size(); ++i) {
      if (r.ranking[i].alternative_id != ref.ranking[i].alternative_id || r.ranking[i].score != ref.ranking[i].score) {
        same = false;
      }
    }
  }
  expect_true(same, "threads: shared Analyzer gives identical rankings");
}

}  // namespace

int main() {
  mcda::set_log_level(mcda::LogLevel::ERROR);

  test_direct_round_trip();
  test_ahp_equal_judgement_matches_direct();
  test_ahp_inconsistent_still_ranks();
  test_validation_failure();
  test_ahp_insufficient();
  test_ahp_engine_failure();
  test_topsis_failure();
  test_selection_order();
  test_invalid_settings();
  test_shared_across_threads();
  return mcda::selftest::finish();
}
