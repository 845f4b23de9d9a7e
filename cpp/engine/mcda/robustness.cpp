// ============================================================================
// Fragment 2.7 — MCDA: Robustness (Implementation)
// File: cpp/engine/mcda/robustness.cpp
// ============================================================================

#include "engine/mcda/robustness.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/online_stats.hpp"
#include "engine/core/rng.hpp"
#include "engine/mcda/topsis.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>

namespace mcda {

namespace {

std::size_t argmax_first(const std::vector<double>& xs) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < xs.size(); ++i) {
        if (xs[i] > xs[best]) best = i;
    }
    return best;
}

// Average ranks (1-based, ascending value), ties share the mean rank.
std::vector<double> average_ranks(const std::vector<double>& xs) {
    std::vector<std::size_t> idx(xs.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
        if (xs[a] != xs[b]) return xs[a] < xs[b];
        return a < b;
    });

    std::vector<double> r(xs.size(), 0.0);
    std::size_t i = 0;
    while (i < idx.size()) {
        std::size_t j = i;
        while (j + 1 < idx.size() && xs[idx[j + 1]] == xs[idx[i]]) ++j;
        const double avg = 0.5 * static_cast<double>(i + j) + 1.0;
        for (std::size_t k = i; k <= j; ++k) r[idx[k]] = avg;
        i = j + 1;
    }
    return r;
}

double mean_abs_diff(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.empty()) return 0.0;
    double acc = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) acc += std::fabs(a[i] - b[i]);
    return acc / static_cast<double>(a.size());
}

std::vector<Criterion> with_weights(const std::vector<Criterion>& criteria,
                                    const std::map<std::string, double>& weights) {
    std::vector<Criterion> out = criteria;
    for (auto& c : out) {
        auto it = weights.find(c.id);
        c.weight = it == weights.end() ? 0.0 : it->second;
    }
    renormalize_weights(out);
    return out;
}

std::map<std::string, double> weight_map(const std::vector<Criterion>& criteria) {
    std::map<std::string, double> m;
    for (const auto& c : criteria) m[c.id] = c.weight;
    return m;
}

} // namespace

// ---------------------------- Free helpers ----------------------------------

double spearman_rank_correlation(const std::vector<double>& a, const std::vector<double>& b) {
    MCDA_REQUIRE(a.size() == b.size(), ErrorCode::InvalidInput, "spearman: series differ in length");
    if (a.size() < 2) return 1.0;

    const std::vector<double> ra = average_ranks(a);
    const std::vector<double> rb = average_ranks(b);

    stats::OnlineStats sa;
    stats::OnlineStats sb;
    for (std::size_t i = 0; i < ra.size(); ++i) {
        sa.push(ra[i]);
        sb.push(rb[i]);
    }

    double cov = 0.0;
    for (std::size_t i = 0; i < ra.size(); ++i) cov += (ra[i] - sa.mean) * (rb[i] - sb.mean);

    const double va = sa.M2;
    const double vb = sb.M2;
    if (va <= 0.0 && vb <= 0.0) return 1.0;
    if (va <= 0.0 || vb <= 0.0) return 0.0;
    return clamp(cov / std::sqrt(va * vb), -1.0, 1.0);
}

std::vector<int> ranks_from_scores(const std::vector<double>& scores) {
    std::vector<std::size_t> idx(scores.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
        if (scores[a] != scores[b]) return scores[a] > scores[b];
        return a < b;
    });
    std::vector<int> ranks(scores.size(), 0);
    for (std::size_t k = 0; k < idx.size(); ++k) ranks[idx[k]] = static_cast<int>(k + 1);
    return ranks;
}

void renormalize_weights(std::vector<Criterion>& criteria) {
    double sum = 0.0;
    for (const auto& c : criteria) {
        MCDA_REQUIRE(is_finite(c.weight) && c.weight >= 0.0, ErrorCode::InvalidInput,
                     "weight for criterion " + c.id + " must be finite and >= 0");
        sum += c.weight;
    }
    MCDA_REQUIRE(sum > 0.0, ErrorCode::InvalidInput, "weights sum to zero");
    for (auto& c : criteria) c.weight /= sum;
}

std::map<std::string, double> SensitivityReport::max_score_change_by_criterion() const {
    std::map<std::string, double> out;
    for (const auto& p : points) {
        double& v = out[p.criterion_id];
        v = std::max(v, p.mean_abs_score_change);
    }
    return out;
}

// ---------------------------- RobustnessAnalyzer ----------------------------

RobustnessAnalyzer::RobustnessAnalyzer(EngineSettings settings) : settings_(std::move(settings)) {
    settings_.validate_or_throw();
}

SensitivityReport RobustnessAnalyzer::weight_sensitivity(const std::vector<Alternative>& alternatives,
                                                         const std::vector<Criterion>& criteria) const {
    SensitivityReport rep;
    rep.base_scores = topsis_scores(alternatives, criteria);
    const std::size_t base_top = argmax_first(rep.base_scores);
    rep.base_top_alternative = alternatives[base_top].id;

    for (std::size_t j = 0; j < criteria.size(); ++j) {
        for (double f : settings_.sensitivity.weight_factors) {
            std::vector<Criterion> perturbed = criteria;
            perturbed[j].weight *= f;
            renormalize_weights(perturbed);

            SensitivityPoint p;
            p.criterion_id = criteria[j].id;
            p.factor = f;
            p.weights = weight_map(perturbed);
            p.scores = topsis_scores(alternatives, perturbed);
            p.mean_abs_score_change = mean_abs_diff(rep.base_scores, p.scores);
            p.rank_correlation = spearman_rank_correlation(rep.base_scores, p.scores);

            const std::size_t top = argmax_first(p.scores);
            p.top_alternative = alternatives[top].id;
            p.top_changed = top != base_top;
            rep.points.push_back(std::move(p));
        }
    }

    log(LogLevel::DEBUG, "weight sensitivity: " + std::to_string(rep.points.size()) + " scenarios");
    return rep;
}

MonteCarloReport RobustnessAnalyzer::monte_carlo(const std::vector<Alternative>& alternatives,
                                                 const std::vector<Criterion>& criteria) const {
    const MonteCarloSettings& cfg = settings_.monte_carlo;

    // Base run surfaces structural problems (empty, degenerate) to the caller.
    (void)topsis_scores(alternatives, criteria);

    const std::size_t n = alternatives.size();
    const double inf = std::numeric_limits<double>::infinity();

    MonteCarloReport rep;
    rep.samples_requested = cfg.samples;
    rep.seed = cfg.seed;
    rep.top_k = std::min(cfg.top_k, n);

    std::vector<std::vector<double>> draws(n);
    for (auto& d : draws) d.reserve(cfg.samples);
    std::vector<stats::OnlineStats> score_stats(n);
    std::vector<stats::OnlineStats> rank_stats(n);
    std::vector<std::size_t> rank1(n, 0);
    std::vector<std::size_t> topk(n, 0);

    Rng64 rng(cfg.seed);

    for (std::size_t s = 0; s < cfg.samples; ++s) {
        std::vector<Criterion> crit = criteria;
        for (auto& c : crit) c.weight *= rng.next_normal(1.0, cfg.weight_sigma, 0.0, inf);

        std::vector<Alternative> alts = alternatives;
        for (auto& a : alts) {
            for (const auto& c : criteria) {
                auto it = a.values.find(c.id);
                if (it != a.values.end()) it->second *= rng.next_normal(1.0, cfg.data_sigma, -inf, inf);
            }
        }

        std::vector<double> scores;
        try {
            renormalize_weights(crit);
            scores = topsis_scores(alts, crit);
        } catch (const McdaError& e) {
            ++rep.samples_failed;
            log(LogLevel::DEBUG, "monte carlo draw " + std::to_string(s) + " skipped: " + e.what());
            continue;
        }

        ++rep.samples_ok;
        const std::vector<int> ranks = ranks_from_scores(scores);
        for (std::size_t i = 0; i < n; ++i) {
            draws[i].push_back(scores[i]);
            score_stats[i].push(scores[i]);
            rank_stats[i].push(static_cast<double>(ranks[i]));
            if (ranks[i] == 1) ++rank1[i];
            if (static_cast<std::size_t>(ranks[i]) <= rep.top_k) ++topk[i];
        }
    }

    MCDA_REQUIRE(rep.samples_ok > 0, ErrorCode::NumericalFailure, "every Monte Carlo draw failed");
    if (rep.samples_failed > 0) {
        log(LogLevel::WARN, "monte carlo: " + std::to_string(rep.samples_failed) + " of " +
                                std::to_string(cfg.samples) + " draws failed and were skipped");
    }

    const double ok = static_cast<double>(rep.samples_ok);
    std::vector<double> means(n, 0.0);
    rep.alternatives.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        McAlternativeStats st;
        st.alternative_id = alternatives[i].id;
        st.name = alternatives[i].name;
        st.mean_score = score_stats[i].mean;
        st.std_score = score_stats[i].stddev_sample();
        st.p025 = stats::quantile(draws[i], 0.025);
        st.p975 = stats::quantile(draws[i], 0.975);
        st.mean_rank = rank_stats[i].mean;
        st.p_rank1 = static_cast<double>(rank1[i]) / ok;
        st.p_top_k = static_cast<double>(topk[i]) / ok;
        means[i] = st.mean_score;
        rep.alternatives.push_back(std::move(st));
    }

    const std::vector<int> robust = ranks_from_scores(means);
    rep.robust_ranking.resize(n);
    for (std::size_t i = 0; i < n; ++i) rep.robust_ranking[static_cast<std::size_t>(robust[i] - 1)] = alternatives[i].id;

    std::ostringstream ss;
    ss << "monte carlo: " << rep.samples_ok << " draws, seed " << rep.seed
       << ", robust top " << rep.robust_ranking.front();
    log(LogLevel::INFO, ss.str());
    return rep;
}

FuzzyReport RobustnessAnalyzer::fuzzy_ranges(const std::vector<Alternative>& alternatives,
                                             const std::vector<Criterion>& criteria,
                                             const std::map<std::string, TriangularWeight>& fuzzy) const {
    std::map<std::string, double> lows;
    std::map<std::string, double> mids;
    std::map<std::string, double> highs;
    std::map<std::string, double> centroids;

    for (const auto& c : criteria) {
        auto it = fuzzy.find(c.id);
        MCDA_REQUIRE(it != fuzzy.end(), ErrorCode::InvalidInput, "no fuzzy weight for criterion " + c.id);
        const TriangularWeight& t = it->second;
        MCDA_REQUIRE(is_finite(t.low) && is_finite(t.mid) && is_finite(t.high) &&
                         t.low >= 0.0 && t.low <= t.mid && t.mid <= t.high,
                     ErrorCode::InvalidInput, "fuzzy weight for " + c.id + " must satisfy 0 <= low <= mid <= high");
        lows[c.id] = t.low;
        mids[c.id] = t.mid;
        highs[c.id] = t.high;
        centroids[c.id] = t.centroid();
    }

    const std::vector<Criterion> crisp = with_weights(criteria, centroids);

    FuzzyReport rep;
    rep.crisp_weights = weight_map(crisp);
    rep.crisp_ranking = rank_topsis(alternatives, crisp);

    std::vector<double> crisp_scores(alternatives.size(), 0.0);
    for (const auto& r : rep.crisp_ranking) crisp_scores[r.input_index] = r.score;

    rep.ranges.resize(alternatives.size());
    for (std::size_t i = 0; i < alternatives.size(); ++i) {
        rep.ranges[i].alternative_id = alternatives[i].id;
        rep.ranges[i].crisp_score = crisp_scores[i];
        rep.ranges[i].min_score = crisp_scores[i];
        rep.ranges[i].max_score = crisp_scores[i];
    }

    for (const auto* scenario : {&lows, &mids, &highs}) {
        std::vector<double> scores;
        try {
            scores = topsis_scores(alternatives, with_weights(criteria, *scenario));
        } catch (const McdaError& e) {
            // An all-zero "low" triangle has no ranking; the crisp range still stands.
            log(LogLevel::DEBUG, std::string("fuzzy scenario skipped: ") + e.what());
            continue;
        }
        for (std::size_t i = 0; i < scores.size(); ++i) {
            rep.ranges[i].min_score = std::min(rep.ranges[i].min_score, scores[i]);
            rep.ranges[i].max_score = std::max(rep.ranges[i].max_score, scores[i]);
        }
    }
    return rep;
}

Diagnostics RobustnessAnalyzer::diagnostics(const std::vector<Alternative>& alternatives,
                                            const std::vector<Criterion>& criteria) const {
    Diagnostics d;
    d.criteria.reserve(criteria.size());
    for (const auto& c : criteria) {
        stats::OnlineStats st;
        for (const auto& a : alternatives) {
            if (const auto v = a.value_of(c.id)) st.push(*v);
        }
        CriterionDispersion cd;
        cd.criterion_id = c.id;
        cd.mean = st.mean;
        cd.stddev = st.stddev_population();
        cd.coefficient_of_variation = safe_div(cd.stddev, std::fabs(cd.mean), 0.0);
        d.criteria.push_back(std::move(cd));
    }

    stats::OnlineStats ss;
    for (double s : topsis_scores(alternatives, criteria)) ss.push(s);
    d.scores.mean = ss.mean;
    d.scores.stddev = ss.stddev_population();
    d.scores.min = ss.min();
    d.scores.max = ss.max();
    d.scores.range = d.scores.max - d.scores.min;
    return d;
}

} // namespace mcda
