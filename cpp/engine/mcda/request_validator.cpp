#include "engine/mcda/request_validator.hpp"

#include "engine/core/numeric.hpp"
#include "engine/mcda/criterion_catalog.hpp"

#include <cmath>
#include <cstdio>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mcda {
namespace {

void add_issue(std::vector<ValidationIssue>& out, std::string code, std::string message, std::string context = {}) {
  ValidationIssue is{};
  is.code = std::move(code);
  is.message = std::move(message);
  is.context = std::move(context);
  out.push_back(std::move(is));
}

std::string fixed3(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

// Inclusive range test with a relative slack so 1.0/9.0 typed by hand passes.
bool in_comparison_range(double v, const ValidationSettings& cfg) {
  if (!is_finite(v)) return false;
  const bool above_min = v >= cfg.min_comparison_value || near(v, cfg.min_comparison_value, 1e-6, 0.0);
  const bool below_max = v <= cfg.max_comparison_value || near(v, cfg.max_comparison_value, 1e-6, 0.0);
  return above_min && below_max;
}

void check_direct_weights(const AnalysisRequest& req,
                          const ValidationSettings& cfg,
                          std::vector<ValidationIssue>& out) {
  if (req.criteria.empty()) return;  // already reported, no sum to check
  double sum = 0.0;
  for (const auto& c : req.criteria) {
    auto it = req.weights.find(c);
    if (it == req.weights.end()) {
      add_issue(out, "WEIGHT_MISSING", "Weight missing for criterion: " + c, c);
      continue;
    }
    const double w = it->second;
    if (!is_finite(w) || w < 0.0 || w > 1.0) {
      add_issue(out, "WEIGHT_OUT_OF_RANGE", "Weight for criterion " + c + " must be between 0 and 1", c);
      continue;
    }
    sum += w;
  }
  if (std::abs(sum - 1.0) > cfg.weight_sum_tolerance) {
    add_issue(out, "WEIGHT_SUM", "Weights must sum to 1, but sum to " + fixed3(sum));
  }
}

void check_comparisons(const AnalysisRequest& req,
                       const ValidationSettings& cfg,
                       std::vector<ValidationIssue>& out) {
  const std::size_t n = req.criteria.size();
  if (n > cfg.max_ahp_criteria) {
    add_issue(out, "AHP_TOO_MANY_CRITERIA",
              "AHP supports at most " + std::to_string(cfg.max_ahp_criteria) + " criteria, got " +
                  std::to_string(n));
  }

  const std::size_t required = n > 1 ? n * (n - 1) / 2 : 0;
  if (req.pairwise_comparisons.size() < required) {
    add_issue(out, "AHP_INSUFFICIENT_COMPARISONS",
              "Insufficient pairwise comparisons. Expected " + std::to_string(required) + ", got " +
                  std::to_string(req.pairwise_comparisons.size()));
  }

  std::unordered_set<std::string> selected(req.criteria.begin(), req.criteria.end());
  for (const auto& pc : req.pairwise_comparisons) {
    const std::string pair = pc.criterion_a + " vs " + pc.criterion_b;
    for (const std::string* id : {&pc.criterion_a, &pc.criterion_b}) {
      if (selected.find(*id) == selected.end()) {
        add_issue(out, "AHP_UNSELECTED_CRITERION",
                  "Pairwise comparison references unselected criterion: " + *id, pair);
      }
    }
    if (pc.criterion_a == pc.criterion_b) {
      add_issue(out, "AHP_SELF_COMPARISON", "Criterion cannot be compared with itself: " + pc.criterion_a, pair);
    }
    if (!in_comparison_range(pc.value, cfg)) {
      add_issue(out, "AHP_VALUE_OUT_OF_RANGE",
                "Comparison value for " + pair + " must be between 1/9 and 9", pair);
    }
  }
}

void check_rows(const AnalysisRequest& req,
                const std::vector<Alternative>& alternatives,
                std::vector<ValidationIssue>& out) {
  std::unordered_map<std::string, const Alternative*> by_id;
  by_id.reserve(alternatives.size());
  for (const auto& a : alternatives) by_id.emplace(a.id, &a);  // first row wins

  std::unordered_set<std::string> seen;
  for (const auto& id : req.alternative_ids) {
    if (!seen.insert(id).second) {
      add_issue(out, "DUPLICATE_ALTERNATIVE", "Duplicate alternative: " + id, id);
      continue;
    }
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      add_issue(out, "ALTERNATIVE_MISSING", "No data supplied for alternative: " + id, id);
      continue;
    }
    for (const auto& c : req.criteria) {
      const auto v = it->second->value_of(c);
      if (!v.has_value() || !is_finite(*v)) {
        add_issue(out, "VALUE_MISSING", "Alternative " + id + " has no value for criterion: " + c, id + "." + c);
      }
    }
  }
}

}  // namespace

std::vector<ValidationIssue> validate_request(const AnalysisRequest& request,
                                              const std::vector<Alternative>& alternatives,
                                              const ValidationSettings& cfg) {
  std::vector<ValidationIssue> out;

  if (request.alternative_ids.size() < cfg.min_alternatives) {
    add_issue(out, "TOO_FEW_ALTERNATIVES",
              "At least " + std::to_string(cfg.min_alternatives) + " alternatives are required for comparison");
  }
  if (request.criteria.size() < cfg.min_criteria) {
    add_issue(out, "TOO_FEW_CRITERIA",
              "At least " + std::to_string(cfg.min_criteria) + " criterion must be selected");
  }

  std::unordered_set<std::string> seen;
  for (const auto& c : request.criteria) {
    if (!CriterionCatalog::contains(c)) {
      add_issue(out, "UNKNOWN_CRITERION", "Unknown criterion: " + c, c);
    }
    if (!seen.insert(c).second) {
      add_issue(out, "DUPLICATE_CRITERION", "Duplicate criterion: " + c, c);
    }
  }

  if (request.method == WeightingMethod::Direct) {
    check_direct_weights(request, cfg, out);
  } else {
    check_comparisons(request, cfg, out);
  }

  check_rows(request, alternatives, out);
  return out;
}

std::vector<std::string> issue_messages(const std::vector<ValidationIssue>& issues) {
  std::vector<std::string> out;
  out.reserve(issues.size());
  for (const auto& is : issues) out.push_back(is.message);
  return out;
}

}  // namespace mcda
