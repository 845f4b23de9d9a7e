/*
===============================================================================
Fragment 2.5 — MCDA: TOPSIS Ranking (Implementation)
File: cpp/engine/mcda/topsis.cpp
===============================================================================
*/

#include "engine/mcda/topsis.hpp"

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace mcda {

namespace {

struct Distances {
  std::vector<double> d_best;
  std::vector<double> d_worst;
  std::vector<double> score;
};

Distances compute_distances(const std::vector<Alternative>& alts, const std::vector<Criterion>& crit) {
  MCDA_REQUIRE(!alts.empty(), ErrorCode::EmptyInput, "TOPSIS requires at least one alternative");
  MCDA_REQUIRE(!crit.empty(), ErrorCode::EmptyInput, "TOPSIS requires at least one criterion");

  const std::size_t n = alts.size();
  const std::size_t m = crit.size();

  // Decision matrix, row = alternative.
  std::vector<std::vector<double>> x(n, std::vector<double>(m, 0.0));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < m; ++j) {
      const auto v = alts[i].value_of(crit[j].id);
      MCDA_REQUIRE(v.has_value() && is_finite(*v), ErrorCode::InvalidInput,
                   "alternative " + alts[i].id + " has no finite value for criterion " + crit[j].id);
      x[i][j] = *v;
    }
  }

  for (std::size_t j = 0; j < m; ++j) {
    const double w = crit[j].weight;
    MCDA_REQUIRE(is_finite(w) && w >= 0.0 && w <= 1.0, ErrorCode::InvalidInput,
                 "weight for criterion " + crit[j].id + " must be in [0,1]");

    double lo = x[0][j];
    double hi = x[0][j];
    double sumsq = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      lo = std::min(lo, x[i][j]);
      hi = std::max(hi, x[i][j]);
      sumsq += x[i][j] * x[i][j];
    }
    MCDA_REQUIRE(hi > lo, ErrorCode::DegenerateCriterion,
                 "criterion " + crit[j].id + " has identical values for every alternative");

    // 1) + 2)
    const double norm = std::sqrt(sumsq);
    MCDA_REQUIRE(is_finite(norm) && norm > 0.0, ErrorCode::NumericalFailure,
                 "column norm for criterion " + crit[j].id + " is not positive");
    for (std::size_t i = 0; i < n; ++i) x[i][j] = (x[i][j] / norm) * w;
  }

  // 3) Ideal points
  std::vector<double> best(m, 0.0);
  std::vector<double> worst(m, 0.0);
  for (std::size_t j = 0; j < m; ++j) {
    double lo = x[0][j];
    double hi = x[0][j];
    for (std::size_t i = 1; i < n; ++i) {
      lo = std::min(lo, x[i][j]);
      hi = std::max(hi, x[i][j]);
    }
    if (crit[j].direction == Direction::Benefit) {
      best[j] = hi;
      worst[j] = lo;
    } else {
      best[j] = lo;
      worst[j] = hi;
    }
  }

  // 4) + 5)
  Distances d;
  d.d_best.resize(n, 0.0);
  d.d_worst.resize(n, 0.0);
  d.score.resize(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    double sb = 0.0;
    double sw = 0.0;
    for (std::size_t j = 0; j < m; ++j) {
      const double db = x[i][j] - best[j];
      const double dw = x[i][j] - worst[j];
      sb += db * db;
      sw += dw * dw;
    }
    d.d_best[i] = safe_sqrt(sb);
    d.d_worst[i] = safe_sqrt(sw);
    d.score[i] = clamp01(safe_div(d.d_worst[i], d.d_best[i] + d.d_worst[i], 0.0));
  }
  return d;
}

} // namespace

std::vector<TopsisResult> rank_topsis(const std::vector<Alternative>& alternatives,
                                      const std::vector<Criterion>& criteria) {
  const Distances d = compute_distances(alternatives, criteria);

  std::vector<TopsisResult> out;
  out.reserve(alternatives.size());
  for (std::size_t i = 0; i < alternatives.size(); ++i) {
    TopsisResult r;
    r.alternative_id = alternatives[i].id;
    r.name = alternatives[i].name;
    r.score = d.score[i];
    r.distance_to_best = d.d_best[i];
    r.distance_to_worst = d.d_worst[i];
    r.input_index = i;
    out.push_back(std::move(r));
  }

  // 6) Explicit tie-break on input order, independent of sort stability.
  std::sort(out.begin(), out.end(), [](const TopsisResult& a, const TopsisResult& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.input_index < b.input_index;
  });

  for (std::size_t k = 0; k < out.size(); ++k) out[k].rank = static_cast<int>(k + 1);
  return out;
}

std::vector<double> topsis_scores(const std::vector<Alternative>& alternatives,
                                  const std::vector<Criterion>& criteria) {
  return compute_distances(alternatives, criteria).score;
}

} // namespace mcda
