#pragma once
/*
================================================================================
Fragment 4.1 — IO: Analysis Request / Response JSON
FILE: cpp/engine/io/analysis_json.hpp

Request document:
  {
    "method": "direct" | "ahp" | "TOPSIS_W" | "TOPSIS_AHP",   default "direct"
    "criteria": ["cost_usd", ...],                             required
    "alternative_ids": ["A", ...],                             default: ids of "alternatives"
    "weights": {"cost_usd": 0.5, ...},
    "pairwise_comparisons": [{"a": "...", "b": "...", "value": 3}],
    "fuzzy_weights": {"cost_usd": [0.3, 0.5, 0.7], ...},
    "alternatives": [{"id": "A", "name": "Site A", "values": {"cost_usd": 100}}]
  }

Schema problems (wrong types, missing id) fail the parse. Semantic problems
(unknown criterion, bad weight sum) are left to the request validator so the
analyst sees them all at once. A null value inside "values" is dropped, which
the validator then reports as a missing value.

Writers emit keys in a fixed order so two runs diff cleanly.
================================================================================
*/

#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"
#include "engine/mcda/robustness.hpp"
#include "engine/mcda/types.hpp"

namespace mcda {

struct AnalysisInput {
  AnalysisRequest request;
  std::vector<Alternative> alternatives;
  std::map<std::string, TriangularWeight> fuzzy_weights;  // empty when absent
};

bool parse_analysis_input_json(std::string_view json, AnalysisInput* out, JsonParseError* err = nullptr);
bool parse_analysis_input_json(std::istream& is, AnalysisInput* out, JsonParseError* err = nullptr);

void write_analysis_response_json(std::ostream& os, const AnalysisResponse& r, const JsonWriteOptions& opt = {});
std::string analysis_response_to_json(const AnalysisResponse& r, const JsonWriteOptions& opt = {});

// Sensitivity + diagnostics (+ fuzzy ranges when `fuzzy` is non-null).
void write_robustness_json(std::ostream& os,
                           const std::vector<Alternative>& alternatives,
                           const SensitivityReport& sens,
                           const Diagnostics& diag,
                           const FuzzyReport* fuzzy,
                           const JsonWriteOptions& opt = {});

void write_monte_carlo_json(std::ostream& os, const MonteCarloReport& mc, const JsonWriteOptions& opt = {});

}  // namespace mcda
