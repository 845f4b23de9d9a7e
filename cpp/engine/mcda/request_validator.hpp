#pragma once
/*
================================================================================
Fragment 2.9 — MCDA: Request Validator (Collect-All)
FILE: cpp/engine/mcda/request_validator.hpp

Purpose:
  - Reject malformed analysis requests before any numeric engine runs.
  - Every rule runs; every violation is reported. One round trip shows the
    analyst everything that needs fixing.

Rule order (stable, tests depend on it):
  1. alternatives selected >= min_alternatives
  2. criteria selected >= min_criteria
  3. per criterion: known to CriterionCatalog, not selected twice
  4. direct:  per criterion weight present and in [0,1]; then sum == 1 +- tol
  5. ahp:     n <= max_ahp_criteria; comparisons >= n(n-1)/2;
              per comparison: selected ids, distinct ids, value in [1/9, 9]
  6. rows:    per selected alternative: not selected twice, a row exists and
              holds a finite value for every selected criterion
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/mcda/types.hpp"

namespace mcda {

struct ValidationIssue final {
  std::string code;     // stable A-Z_ identifier, e.g. "WEIGHT_SUM"
  std::string message;  // analyst-facing text
  std::string context;  // offending id / pair, may be empty
};

std::vector<ValidationIssue> validate_request(const AnalysisRequest& request,
                                              const std::vector<Alternative>& alternatives,
                                              const ValidationSettings& cfg = {});

// Messages only, in rule order.
std::vector<std::string> issue_messages(const std::vector<ValidationIssue>& issues);

}  // namespace mcda
