/*
  Fragment 2.4.T — AHP Weight Derivation Selftest

  Checks:
    1) Comparison matrix is reciprocal with a unit diagonal, whatever the
       order the comparisons were supplied in.
    2) Single criterion: weight 1, CR 0.
    3) A transitive 3x3 judgement set has CR ~ 0 and is consistent.
    4) A missing pair fails with IncompleteMatrix.
    5) A strongly intransitive set is reported inconsistent, weights still used.

  Run: ./ahp_selftest   (non-zero exit on failure)
*/

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/selftest.hpp"
#include "engine/mcda/ahp.hpp"

namespace {

using namespace mcda;
using namespace mcda::selftest;

PairwiseComparison cmp(const std::string& a, const std::string& b, double v) {
  PairwiseComparison pc;
  pc.criterion_a = a;
  pc.criterion_b = b;
  pc.value = v;
  return pc;
}

double sum_weights(const AhpResult& r) {
  double s = 0.0;
  for (const auto& kv : r.weights) s += kv.second;
  return s;
}

void test_reciprocity_any_order() {
  const std::vector<std::string> crit{"cost_usd", "capacity_kw", "pv_npv"};
  // Mixed orientation: two of three supplied lower-triangle first.
  const std::vector<PairwiseComparison> comps{
      cmp("capacity_kw", "cost_usd", 3.0),
      cmp("pv_npv", "cost_usd", 1.0 / 5.0),
      cmp("capacity_kw", "pv_npv", 2.0),
  };

  const Matrix m = build_comparison_matrix(crit, comps);

  bool unit_diag = true;
  bool reciprocal = true;
  for (std::size_t i = 0; i < m.size(); ++i) {
    if (m[i][i] != 1.0) unit_diag = false;
    for (std::size_t j = 0; j < m.size(); ++j) {
      if (std::fabs(m[i][j] * m[j][i] - 1.0) > 1e-12) reciprocal = false;
    }
  }
  expect_true(unit_diag, "matrix: diagonal is 1");
  expect_true(reciprocal, "matrix: M[i][j] * M[j][i] == 1");
  expect_near(m[0][1], 1.0 / 3.0, 1e-12, "matrix: (b,a)=3 stored as M[a][b]=1/3");
  expect_near(m[0][2], 5.0, 1e-12, "matrix: (c,a)=1/5 stored as M[a][c]=5");
  expect_near(m[1][2], 2.0, 1e-12, "matrix: upper-triangle value kept as supplied");
}

void test_duplicate_pair_first_wins() {
  const std::vector<std::string> crit{"a", "b"};
  const Matrix m = build_comparison_matrix(crit, {cmp("a", "b", 3.0), cmp("b", "a", 5.0)});
  expect_near(m[0][1], 3.0, 1e-12, "duplicate pair: first comparison kept");
  expect_near(m[1][0], 1.0 / 3.0, 1e-12, "duplicate pair: reciprocal of first kept");
}

void test_single_criterion() {
  const AhpEngine eng;
  const AhpResult r = eng.derive_weights({"cost_usd"}, std::vector<PairwiseComparison>{});
  expect_near(r.weights.at("cost_usd"), 1.0, 0.0, "n=1: weight is exactly 1");
  expect_true(r.consistency_ratio == 0.0, "n=1: CR is exactly 0");
  expect_true(r.is_consistent, "n=1: consistent");
}

void test_two_criteria_always_consistent() {
  const AhpEngine eng;
  const AhpResult r = eng.derive_weights({"a", "b"}, {cmp("a", "b", 4.0)});
  expect_near(r.weights.at("a"), 0.8, 1e-12, "n=2: 4:1 judgement gives 0.8");
  expect_near(r.weights.at("b"), 0.2, 1e-12, "n=2: 4:1 judgement gives 0.2");
  expect_true(r.consistency_index == 0.0 && r.consistency_ratio == 0.0, "n=2: CI and CR are 0");
}

void test_consistent_three() {
  const AhpEngine eng;
  const std::vector<std::string> crit{"c1", "c2", "c3"};
  const AhpResult r = eng.derive_weights(crit, {cmp("c1", "c2", 9.0), cmp("c1", "c3", 1.0), cmp("c2", "c3", 1.0 / 9.0)});

  expect_near(r.consistency_ratio, 0.0, 1e-9, "transitive 3x3: CR ~ 0");
  expect_true(r.is_consistent, "transitive 3x3: is_consistent");
  expect_near(r.lambda_max, 3.0, 1e-9, "transitive 3x3: lambda_max ~ n");
  expect_near(r.weights.at("c1"), 9.0 / 19.0, 1e-12, "transitive 3x3: w1 = 9/19");
  expect_near(r.weights.at("c2"), 1.0 / 19.0, 1e-12, "transitive 3x3: w2 = 1/19");
  expect_near(r.weights.at("c3"), 9.0 / 19.0, 1e-12, "transitive 3x3: w3 = 9/19");
  expect_near(sum_weights(r), 1.0, 1e-12, "transitive 3x3: weights sum to 1");
  expect_true(r.eigenvector.size() == 3 && std::fabs(r.eigenvector[1] - 1.0 / 19.0) < 1e-12,
              "transitive 3x3: eigenvector in criterion order");
}

void test_incomplete_matrix() {
  const AhpEngine eng;
  expect_throws_code([&] { (void)eng.derive_weights({"a", "b", "c"}, {cmp("a", "b", 3.0)}); },
                     ErrorCode::IncompleteMatrix, "1 of 3 comparisons: IncompleteMatrix");
}

void test_bad_comparisons() {
  const AhpEngine eng;
  expect_throws_code([&] { (void)build_comparison_matrix({"a", "b"}, {cmp("a", "a", 3.0)}); },
                     ErrorCode::InvalidInput, "self comparison rejected");
  expect_throws_code([&] { (void)build_comparison_matrix({"a", "b"}, {cmp("a", "z", 3.0)}); },
                     ErrorCode::InvalidInput, "unknown criterion rejected");
  expect_throws_code([&] { (void)build_comparison_matrix({"a", "b"}, {cmp("a", "b", 0.0)}); },
                     ErrorCode::InvalidInput, "zero comparison value rejected");
  expect_throws_code([&] { (void)build_comparison_matrix({}, {}); },
                     ErrorCode::EmptyInput, "no criteria rejected");
}

void test_inconsistent_still_returns_weights() {
  const AhpEngine eng;
  // a >> b, b >> c, yet c >> a.
  const AhpResult r = eng.derive_weights({"a", "b", "c"},
                                         {cmp("a", "b", 9.0), cmp("b", "c", 9.0), cmp("a", "c", 1.0 / 9.0)});
  expect_true(r.consistency_ratio > 0.10, "cyclic judgements: CR > 0.10");
  expect_true(!r.is_consistent, "cyclic judgements: flagged inconsistent");
  expect_near(sum_weights(r), 1.0, 1e-9, "cyclic judgements: weights still sum to 1");
}

void test_four_criteria_weights() {
  const AhpEngine eng;
  const std::vector<std::string> crit{"a", "b", "c", "d"};
  std::vector<PairwiseComparison> comps;
  for (const auto& [x, y] : generate_comparison_pairs(crit)) comps.push_back(cmp(x, y, 2.0));
  const AhpResult r = eng.derive_weights(crit, comps);
  expect_near(sum_weights(r), 1.0, 1e-12, "4x4: weights sum to 1");
  expect_true(r.weights.at("a") > r.weights.at("b") && r.weights.at("b") > r.weights.at("c") &&
                  r.weights.at("c") > r.weights.at("d"),
              "4x4: each criterion preferred to the next keeps that order");
  expect_true(r.lambda_max >= 4.0 - 1e-9, "4x4: lambda_max >= n");
}

void test_helpers() {
  expect_near(random_index(1), 0.0, 0.0, "RI(1) = 0");
  expect_near(random_index(3), 0.58, 0.0, "RI(3) = 0.58");
  expect_near(random_index(10), 1.49, 0.0, "RI(10) = 1.49");
  expect_near(random_index(15), 1.59, 0.0, "RI(15) = 1.59");
  expect_near(random_index(40), 1.59, 0.0, "RI(n > 15) = RI(15)");

  const auto pairs = generate_comparison_pairs({"a", "b", "c"});
  expect_true(pairs.size() == 3, "pairs: n(n-1)/2 for n=3");
  expect_true(pairs[0] == std::make_pair(std::string("a"), std::string("b")) &&
                  pairs[1] == std::make_pair(std::string("a"), std::string("c")) &&
                  pairs[2] == std::make_pair(std::string("b"), std::string("c")),
              "pairs: upper triangle in criterion order");
  expect_true(generate_comparison_pairs({"a"}).empty(), "pairs: none for n=1");

  expect_eq_str(describe_comparison(1.0), "Equal importance", "scale: 1");
  expect_eq_str(describe_comparison(5.0), "Strong importance", "scale: 5");
  expect_eq_str(describe_comparison(9.0), "Extreme importance", "scale: 9");
  expect_eq_str(describe_comparison(1.0 / 3.0), "Reciprocal of Moderate importance", "scale: 1/3");

  const auto eq = equal_weights({"a", "b", "c", "d"});
  expect_true(eq.size() == 4 && std::fabs(eq.at("c") - 0.25) < 1e-15, "equal_weights: 1/n each");
  expect_true(equal_weights({}).empty(), "equal_weights: empty input");
}

}  // namespace

int main() {
  test_reciprocity_any_order();
  test_duplicate_pair_first_wins();
  test_single_criterion();
  test_two_criteria_always_consistent();
  test_consistent_three();
  test_incomplete_matrix();
  test_bad_comparisons();
  test_inconsistent_still_returns_weights();
  test_four_criteria_weights();
  test_helpers();
  return mcda::selftest::finish();
}
