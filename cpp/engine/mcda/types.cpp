/*
================================================================================
Fragment 2.0 — MCDA: Data Model (enum names)
FILE: cpp/engine/mcda/types.cpp
================================================================================
*/

#include "engine/mcda/types.hpp"

namespace mcda {

const char* to_string(Direction d) noexcept {
  switch (d) {
    case Direction::Benefit: return "benefit";
    case Direction::Cost:    return "cost";
    default:                 return "unknown";
  }
}

const char* to_string(WeightingMethod m) noexcept {
  switch (m) {
    case WeightingMethod::Direct: return "direct";
    case WeightingMethod::Ahp:    return "ahp";
    default:                      return "unknown";
  }
}

const char* to_string(AnalysisStatus s) noexcept {
  switch (s) {
    case AnalysisStatus::Success: return "success";
    case AnalysisStatus::Failed:  return "failed";
    default:                      return "unknown";
  }
}

const char* to_string(AnalysisStage s) noexcept {
  switch (s) {
    case AnalysisStage::None:           return "none";
    case AnalysisStage::Validate:       return "validate";
    case AnalysisStage::ResolveWeights: return "resolve_weights";
    case AnalysisStage::Rank:           return "rank";
    default:                            return "unknown";
  }
}

bool parse_direction(const std::string& s, Direction& out) noexcept {
  if (s == "benefit") { out = Direction::Benefit; return true; }
  if (s == "cost")    { out = Direction::Cost;    return true; }
  return false;
}

bool parse_weighting_method(const std::string& s, WeightingMethod& out) noexcept {
  if (s == "direct" || s == "TOPSIS_W")  { out = WeightingMethod::Direct; return true; }
  if (s == "ahp" || s == "TOPSIS_AHP")   { out = WeightingMethod::Ahp;    return true; }
  return false;
}

}  // namespace mcda
