#pragma once
/*
================================================================================
Fragment 2.6 — MCDA: Analyzer (Validate -> Resolve Weights -> Rank)
FILE: cpp/engine/mcda/orchestrator.hpp

Purpose:
  - The one entry point that turns a request plus resolved value rows into a
    response. Internal engine failures stop here and come back as strings.

State flow:
  Start -> Validate -> { Failed(errors) | WeightsResolved } -> Ranked -> Success

Rules:
  - Construct once, call many times. analyze() is const and touches no shared
    state besides the logger, so one Analyzer may serve many threads.
  - A failed response never carries a ranking.
  - AHP inconsistency is reported in response.ahp, never blocks.
================================================================================
*/

#include <map>
#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/mcda/ahp.hpp"
#include "engine/mcda/types.hpp"

namespace mcda {

class Analyzer final {
public:
  explicit Analyzer(EngineSettings settings = EngineSettings::defaults());

  AnalysisResponse analyze(const AnalysisRequest& request, const std::vector<Alternative>& alternatives) const;

  const EngineSettings& settings() const noexcept { return settings_; }

private:
  EngineSettings settings_;
  AhpEngine ahp_;
};

// Catalog metadata + weight for each id, in id order. Unknown ids keep the id
// as name and default to Benefit.
std::vector<Criterion> resolve_criteria(const std::vector<std::string>& ids,
                                        const std::map<std::string, double>& weights);

// Rows for `ids`, in `ids` order. Ids without a row are skipped.
std::vector<Alternative> select_alternatives(const std::vector<std::string>& ids,
                                             const std::vector<Alternative>& rows);

}  // namespace mcda
