#include "engine/mcda/orchestrator.hpp"

#include "engine/core/logging.hpp"
#include "engine/mcda/criterion_catalog.hpp"
#include "engine/mcda/request_validator.hpp"
#include "engine/mcda/topsis.hpp"

#include <exception>
#include <unordered_map>
#include <utility>

namespace mcda {

namespace {

void mark_failed(AnalysisResponse& r, AnalysisStage stage, std::vector<std::string> errors) {
  r.status = AnalysisStatus::Failed;
  r.failed_stage = stage;
  r.ranking.clear();
  r.validation_errors = std::move(errors);
}

}  // namespace

Analyzer::Analyzer(EngineSettings settings) : settings_(std::move(settings)), ahp_(settings_.consistency) {
  settings_.validate_or_throw();
}

AnalysisResponse Analyzer::analyze(const AnalysisRequest& request, const std::vector<Alternative>& alternatives) const {
  AnalysisResponse resp;
  resp.method = request.method;

  // ---- Validate ----
  const auto issues = validate_request(request, alternatives, settings_.validation);
  if (!issues.empty()) {
    log(LogLevel::INFO, "analysis rejected: " + std::to_string(issues.size()) + " validation error(s)");
    for (const auto& is : issues) log(LogLevel::DEBUG, "  " + is.code + ": " + is.message);
    mark_failed(resp, AnalysisStage::Validate, issue_messages(issues));
    return resp;
  }

  // ---- Resolve weights ----
  if (request.method == WeightingMethod::Direct) {
    for (const auto& c : request.criteria) resp.resolved_weights[c] = request.weights.at(c);
  } else {
    try {
      AhpResult ahp = ahp_.derive_weights(request.criteria, request.pairwise_comparisons);
      resp.resolved_weights = ahp.weights;
      resp.ahp = std::move(ahp);
    } catch (const std::exception& e) {
      const std::string msg = std::string("AHP analysis failed: ") + e.what();
      log(LogLevel::WARN, msg);
      mark_failed(resp, AnalysisStage::ResolveWeights, {msg});
      return resp;
    }
  }

  resp.criteria = resolve_criteria(request.criteria, resp.resolved_weights);
  resp.alternatives = select_alternatives(request.alternative_ids, alternatives);

  // ---- Rank ----
  try {
    resp.ranking = rank_topsis(resp.alternatives, resp.criteria);
  } catch (const std::exception& e) {
    const std::string msg = std::string("TOPSIS analysis failed: ") + e.what();
    log(LogLevel::WARN, msg);
    mark_failed(resp, AnalysisStage::Rank, {msg});
    return resp;
  }

  resp.status = AnalysisStatus::Success;
  resp.failed_stage = AnalysisStage::None;
  log(LogLevel::DEBUG, std::string("analysis ok: method=") + to_string(request.method) +
                           " alternatives=" + std::to_string(resp.ranking.size()) +
                           " top=" + resp.ranking.front().alternative_id);
  return resp;
}

std::vector<Criterion> resolve_criteria(const std::vector<std::string>& ids,
                                        const std::map<std::string, double>& weights) {
  std::vector<Criterion> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    Criterion c;
    c.id = id;
    c.name = id;
    if (const auto spec = CriterionCatalog::lookup(id)) {
      c.name = std::string(spec->name);
      c.direction = spec->direction;
      c.unit = std::string(spec->unit);
    }
    auto it = weights.find(id);
    c.weight = it == weights.end() ? 0.0 : it->second;
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<Alternative> select_alternatives(const std::vector<std::string>& ids,
                                             const std::vector<Alternative>& rows) {
  std::unordered_map<std::string, const Alternative*> by_id;
  by_id.reserve(rows.size());
  for (const auto& a : rows) by_id.emplace(a.id, &a);

  std::vector<Alternative> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    auto it = by_id.find(id);
    if (it != by_id.end()) out.push_back(*it->second);
  }
  return out;
}

}  // namespace mcda
