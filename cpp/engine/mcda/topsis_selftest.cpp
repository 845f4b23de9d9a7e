/*
  Fragment 2.5.T — TOPSIS Ranking Selftest

  Checks:
    1) Hand-computed 3 x 2 example (cost + benefit, equal weights).
    2) Every score lies in [0, 1].
    3) A dominating alternative never scores below the dominated one.
    4) Identical rows rank in input order; repeated runs are bit-identical.
    5) EmptyInput / DegenerateCriterion / missing value failures.

  Run: ./topsis_selftest   (non-zero exit on failure)
*/

#include <string>
#include <vector>

#include "engine/core/selftest.hpp"
#include "engine/mcda/topsis.hpp"

namespace {

using namespace mcda;
using namespace mcda::selftest;

Alternative alt(const std::string& id, double cost, double capacity) {
  Alternative a;
  a.id = id;
  a.name = "Site " + id;
  a.values["cost_usd"] = cost;
  a.values["capacity_kw"] = capacity;
  return a;
}

std::vector<Criterion> cost_capacity(double w_cost, double w_cap) {
  Criterion cost;
  cost.id = "cost_usd";
  cost.name = "Cost";
  cost.direction = Direction::Cost;
  cost.weight = w_cost;

  Criterion cap;
  cap.id = "capacity_kw";
  cap.name = "Capacity";
  cap.direction = Direction::Benefit;
  cap.weight = w_cap;
  return {cost, cap};
}

void test_hand_computed_example() {
  const std::vector<Alternative> alts{alt("A", 100, 5), alt("B", 200, 10), alt("C", 150, 8)};
  const auto r = rank_topsis(alts, cost_capacity(0.5, 0.5));

  expect_true(r.size() == 3, "example: three results");
  expect_eq_str(r[0].alternative_id, "C", "example: rank 1 is C");
  expect_eq_str(r[1].alternative_id, "A", "example: rank 2 is A");
  expect_eq_str(r[2].alternative_id, "B", "example: rank 3 is B");
  expect_true(r[0].rank == 1 && r[1].rank == 2 && r[2].rank == 3, "example: ranks are 1..3");

  expect_near(r[0].score, 0.548464, 1e-5, "example: score(C)");
  expect_near(r[1].score, 0.505234, 1e-5, "example: score(A)");
  expect_near(r[2].score, 0.494766, 1e-5, "example: score(B)");

  expect_near(r[0].distance_to_best, 0.117948, 1e-5, "example: d_best(C)");
  expect_near(r[0].distance_to_worst, 0.143267, 1e-5, "example: d_worst(C)");
  expect_near(r[1].distance_to_best, 0.181848, 1e-5, "example: d_best(A)");
  expect_near(r[1].distance_to_worst, 0.185695, 1e-5, "example: d_worst(A)");

  // Ranked C, A, B; input rows were A, B, C.
  expect_true(r[0].input_index == 2 && r[1].input_index == 0 && r[2].input_index == 1,
              "example: input_index points back to input rows");
  expect_eq_str(r[0].name, "Site C", "example: name carried through");
}

void test_score_bounds() {
  const std::vector<Alternative> alts{alt("A", 1, 1), alt("B", 1e6, 3), alt("C", 50, 900), alt("D", 0, 0.5)};
  const auto r = rank_topsis(alts, cost_capacity(0.9, 0.1));
  bool in_bounds = true;
  for (const auto& x : r) {
    if (!(x.score >= 0.0 && x.score <= 1.0)) in_bounds = false;
  }
  expect_true(in_bounds, "bounds: every score in [0,1]");
}

void test_dominance() {
  // A: cheaper and bigger than B.
  const std::vector<Alternative> alts{alt("B", 180, 6), alt("X", 120, 20), alt("A", 150, 9)};
  const auto scores = topsis_scores(alts, cost_capacity(0.3, 0.7));
  expect_true(scores[2] >= scores[0], "dominance: A (<= cost, >= capacity) scores >= B");

  // Weak dominance: equal cost, more capacity.
  const std::vector<Alternative> alts2{alt("B", 100, 5), alt("A", 100, 7), alt("Z", 300, 1)};
  const auto s2 = topsis_scores(alts2, cost_capacity(0.5, 0.5));
  expect_true(s2[1] >= s2[0], "dominance: one strict inequality is enough");
}

void test_tie_break_determinism() {
  const std::vector<Alternative> alts{alt("P", 100, 5), alt("Q", 200, 10), alt("R", 100, 5)};
  const auto r1 = rank_topsis(alts, cost_capacity(0.5, 0.5));
  const auto r2 = rank_topsis(alts, cost_capacity(0.5, 0.5));

  std::size_t pos_p = 0;
  std::size_t pos_r = 0;
  for (std::size_t k = 0; k < r1.size(); ++k) {
    if (r1[k].alternative_id == "P") pos_p = k;
    if (r1[k].alternative_id == "R") pos_r = k;
  }
  expect_true(r1[pos_p].score == r1[pos_r].score, "tie: identical rows give identical scores");
  expect_true(pos_p < pos_r, "tie: first-seen alternative ranked higher");

  bool same = r1.size() == r2.size();
  for (std::size_t k = 0; same && k < r1.size(); ++k) {
    same = r1[k].alternative_id == r2[k].alternative_id && r1[k].score == r2[k].score;
  }
  expect_true(same, "tie: repeated runs are bit-identical");
}

void test_failures() {
  expect_throws_code([] { (void)rank_topsis({}, cost_capacity(0.5, 0.5)); },
                     ErrorCode::EmptyInput, "no alternatives: EmptyInput");
  expect_throws_code([] { (void)rank_topsis({alt("A", 1, 2), alt("B", 2, 3)}, {}); },
                     ErrorCode::EmptyInput, "no criteria: EmptyInput");
  expect_throws_code([] { (void)rank_topsis({alt("A", 100, 5), alt("B", 100, 9)}, cost_capacity(0.5, 0.5)); },
                     ErrorCode::DegenerateCriterion, "constant cost column: DegenerateCriterion");
  expect_throws_code([] { (void)rank_topsis({alt("A", 0, 5), alt("B", 0, 9)}, cost_capacity(0.5, 0.5)); },
                     ErrorCode::DegenerateCriterion, "all-zero column: DegenerateCriterion");

  Alternative broken = alt("B", 2, 3);
  broken.values.erase("capacity_kw");
  expect_throws_code([&] { (void)rank_topsis({alt("A", 1, 2), broken}, cost_capacity(0.5, 0.5)); },
                     ErrorCode::InvalidInput, "missing value: InvalidInput");
}

void test_weight_shift_changes_winner() {
  const std::vector<Alternative> alts{alt("A", 100, 5), alt("B", 200, 10), alt("C", 150, 8)};
  const auto cost_heavy = rank_topsis(alts, cost_capacity(0.9, 0.1));
  const auto cap_heavy = rank_topsis(alts, cost_capacity(0.1, 0.9));
  expect_eq_str(cost_heavy[0].alternative_id, "A", "weights: cost-heavy prefers the cheapest");
  expect_eq_str(cap_heavy[0].alternative_id, "B", "weights: capacity-heavy prefers the largest");
}

}  // namespace

int main() {
  test_hand_computed_example();
  test_score_bounds();
  test_dominance();
  test_tie_break_determinism();
  test_failures();
  test_weight_shift_changes_winner();
  return mcda::selftest::finish();
}
