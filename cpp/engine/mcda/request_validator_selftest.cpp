/*
  Fragment 2.9.T — Request Validator Selftest

  Checks:
    1) A well-formed request produces no issues.
    2) Every rule runs: one request with several problems reports all of
       them, in rule order, with the exact analyst-facing text.
    3) AHP with 1 of 3 comparisons reports exactly the missing-comparison
       error.
    4) AHP comparison rules, weight range, row coverage.

  Run: ./request_validator_selftest   (non-zero exit on failure)
*/

#include <limits>
#include <string>
#include <vector>

#include "engine/core/selftest.hpp"
#include "engine/mcda/criterion_catalog.hpp"
#include "engine/mcda/request_validator.hpp"

namespace {

using namespace mcda;
using namespace mcda::selftest;

Alternative row(const std::string& id, const std::vector<std::string>& criteria, double base) {
  Alternative a;
  a.id = id;
  a.name = id;
  double v = base;
  for (const auto& c : criteria) a.values[c] = v++;
  return a;
}

PairwiseComparison cmp(const std::string& a, const std::string& b, double v) {
  PairwiseComparison pc;
  pc.criterion_a = a;
  pc.criterion_b = b;
  pc.value = v;
  return pc;
}

bool has_code(const std::vector<ValidationIssue>& issues, const std::string& code) {
  for (const auto& is : issues) {
    if (is.code == code) return true;
  }
  return false;
}

void dump(const std::vector<ValidationIssue>& issues) {
  for (const auto& is : issues) std::cerr << "    " << is.code << ": " << is.message << "\n";
}

AnalysisRequest direct_request() {
  AnalysisRequest r;
  r.alternative_ids = {"A", "B", "C"};
  r.criteria = {"cost_usd", "capacity_kw"};
  r.method = WeightingMethod::Direct;
  r.weights = {{"cost_usd", 0.5}, {"capacity_kw", 0.5}};
  return r;
}

std::vector<Alternative> rows_for(const AnalysisRequest& r) {
  std::vector<Alternative> out;
  double base = 1.0;
  for (const auto& id : r.alternative_ids) {
    out.push_back(row(id, r.criteria, base));
    base += 10.0;
  }
  return out;
}

void test_valid_direct() {
  const AnalysisRequest r = direct_request();
  const auto issues = validate_request(r, rows_for(r));
  expect_true(issues.empty(), "direct: well-formed request has no issues");
  if (!issues.empty()) dump(issues);
}

void test_weight_sum_tolerance() {
  AnalysisRequest r = direct_request();
  r.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  r.weights = {{"cost_usd", 0.3333}, {"capacity_kw", 0.3333}, {"pv_npv", 0.3333}};
  expect_true(validate_request(r, rows_for(r)).empty(), "direct: sum 0.9999 is within 1e-3");

  r.weights["pv_npv"] = 0.3;
  const auto issues = validate_request(r, rows_for(r));
  expect_true(issues.size() == 1, "direct: sum 0.9666 is one issue");
  if (!issues.empty()) expect_eq_str(issues[0].message, "Weights must sum to 1, but sum to 0.967", "direct: sum message");
}

void test_collects_all_errors() {
  AnalysisRequest r;
  r.alternative_ids = {"A"};
  r.criteria = {"cost_usd", "bogus"};
  r.method = WeightingMethod::Direct;
  r.weights = {{"cost_usd", 0.9}};

  std::vector<Alternative> rows{row("A", {"cost_usd"}, 1.0)};
  const auto msgs = issue_messages(validate_request(r, rows));

  const std::vector<std::string> want{
      "At least 2 alternatives are required for comparison",
      "Unknown criterion: bogus",
      "Weight missing for criterion: bogus",
      "Weights must sum to 1, but sum to 0.900",
      "Alternative A has no value for criterion: bogus",
  };
  expect_true(msgs.size() == want.size(), "collect-all: five problems, five messages");
  for (std::size_t i = 0; i < want.size() && i < msgs.size(); ++i) {
    expect_eq_str(msgs[i], want[i], "collect-all: message " + std::to_string(i + 1) + " in rule order");
  }
}

void test_no_criteria() {
  AnalysisRequest r = direct_request();
  r.criteria.clear();
  r.weights.clear();
  const auto msgs = issue_messages(validate_request(r, rows_for(direct_request())));
  expect_true(msgs.size() == 1, "no criteria: single issue");
  if (!msgs.empty()) expect_eq_str(msgs[0], "At least 1 criterion must be selected", "no criteria: message");
}

void test_duplicate_and_range() {
  AnalysisRequest r = direct_request();
  r.criteria = {"cost_usd", "cost_usd"};
  r.weights = {{"cost_usd", 0.5}};
  const auto issues = validate_request(r, rows_for(r));
  expect_true(has_code(issues, "DUPLICATE_CRITERION"), "duplicate criterion reported");

  AnalysisRequest r2 = direct_request();
  r2.weights = {{"cost_usd", 1.5}, {"capacity_kw", -0.5}};
  const auto issues2 = validate_request(r2, rows_for(r2));
  expect_true(has_code(issues2, "WEIGHT_OUT_OF_RANGE"), "weight outside [0,1] reported");
}

void test_ahp_insufficient_comparisons() {
  AnalysisRequest r;
  r.alternative_ids = {"A", "B", "C"};
  r.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  r.method = WeightingMethod::Ahp;
  r.pairwise_comparisons = {cmp("cost_usd", "capacity_kw", 3.0)};

  const auto issues = validate_request(r, rows_for(r));
  expect_true(issues.size() == 1, "ahp 1 of 3: exactly one issue");
  if (issues.size() != 1) dump(issues);
  if (!issues.empty()) {
    expect_eq_str(issues[0].message, "Insufficient pairwise comparisons. Expected 3, got 1",
                  "ahp 1 of 3: missing-comparison message");
  }
}

void test_ahp_comparison_rules() {
  AnalysisRequest r;
  r.alternative_ids = {"A", "B"};
  r.criteria = {"cost_usd", "capacity_kw", "pv_npv"};
  r.method = WeightingMethod::Ahp;
  r.pairwise_comparisons = {
      cmp("cost_usd", "capacity_kw", 1.0 / 9.0),  // boundary, valid
      cmp("cost_usd", "pv_irr", 3.0),             // not selected
      cmp("pv_npv", "pv_npv", 1.0),               // self
      cmp("capacity_kw", "pv_npv", 10.0),         // out of range
  };

  const auto issues = validate_request(r, rows_for(r));
  expect_true(has_code(issues, "AHP_UNSELECTED_CRITERION"), "ahp: unselected criterion reported");
  expect_true(has_code(issues, "AHP_SELF_COMPARISON"), "ahp: self comparison reported");
  expect_true(has_code(issues, "AHP_VALUE_OUT_OF_RANGE"), "ahp: value 10 reported");
  expect_true(issues.size() == 3, "ahp: 1/9 accepted, nothing else reported");
  if (issues.size() != 3) dump(issues);
}

void test_ahp_too_many_criteria() {
  AnalysisRequest r;
  r.alternative_ids = {"A", "B"};
  r.method = WeightingMethod::Ahp;
  for (const auto& spec : CriterionCatalog::all()) r.criteria.emplace_back(spec.id);

  const auto issues = validate_request(r, rows_for(r));
  expect_true(r.criteria.size() == 16, "catalog: 16 criteria available");
  expect_true(has_code(issues, "AHP_TOO_MANY_CRITERIA"), "ahp: 16 criteria exceeds 15");
  expect_true(has_code(issues, "AHP_INSUFFICIENT_COMPARISONS"), "ahp: 0 of 120 comparisons reported");
}

void test_rows() {
  AnalysisRequest r = direct_request();
  r.alternative_ids = {"A", "B", "B", "Z"};
  std::vector<Alternative> rows{row("A", r.criteria, 1.0), row("B", r.criteria, 5.0)};
  rows[0].values["capacity_kw"] = std::numeric_limits<double>::quiet_NaN();

  const auto issues = validate_request(r, rows);
  expect_true(has_code(issues, "DUPLICATE_ALTERNATIVE"), "rows: duplicate alternative id reported");
  expect_true(has_code(issues, "ALTERNATIVE_MISSING"), "rows: id without data reported");
  expect_true(has_code(issues, "VALUE_MISSING"), "rows: NaN value reported");
  expect_true(issues.size() == 3, "rows: exactly three issues");
  if (issues.size() != 3) dump(issues);
}

}  // namespace

int main() {
  test_valid_direct();
  test_weight_sum_tolerance();
  test_collects_all_errors();
  test_no_criteria();
  test_duplicate_and_range();
  test_ahp_insufficient_comparisons();
  test_ahp_comparison_rules();
  test_ahp_too_many_criteria();
  test_rows();
  return mcda::selftest::finish();
}
