/*
===============================================================================
Fragment 2.5 — MCDA: TOPSIS Ranking
File: cpp/engine/mcda/topsis.hpp
===============================================================================

Standard six-step TOPSIS over an alternatives x criteria decision matrix:
  1) vector-normalize each column
  2) multiply by the criterion weight
  3) ideal best / worst per column (benefit: max/min, cost: min/max)
  4) Euclidean distances d_best, d_worst
  5) score = d_worst / (d_best + d_worst), 0 when both distances are 0
  6) rank by score descending; equal scores keep input order

Throws McdaError:
  EmptyInput           no alternatives or no criteria
  InvalidInput         missing / non-finite value, weight outside [0,1]
  DegenerateCriterion  a column holds the same value for every alternative
===============================================================================
*/

#pragma once

#include "engine/mcda/types.hpp"

#include <vector>

namespace mcda {

// Sorted by rank. input_index points back into `alternatives`.
std::vector<TopsisResult> rank_topsis(const std::vector<Alternative>& alternatives,
                                      const std::vector<Criterion>& criteria);

// Closeness scores only, in input order.
std::vector<double> topsis_scores(const std::vector<Alternative>& alternatives,
                                  const std::vector<Criterion>& criteria);

} // namespace mcda
