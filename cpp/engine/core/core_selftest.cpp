// ============================================================================
// Fragment 1.8 — Core: Selftest (settings, stats, RNG, logging, errors)
// File: cpp/engine/core/core_selftest.cpp
// ============================================================================
//
// Run: ./core_selftest   (non-zero exit on failure)
//
// ============================================================================

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/online_stats.hpp"
#include "engine/core/rng.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace mcda;
using namespace mcda::selftest;

void test_settings() {
    expect_no_throw([] { EngineSettings::defaults().validate_or_throw(); }, "settings: defaults validate");

    EngineSettings s = EngineSettings::defaults();
    expect_near(s.consistency.max_consistency_ratio, 0.10, 0.0, "settings: CR threshold 0.10");
    expect_near(s.validation.weight_sum_tolerance, 1e-3, 0.0, "settings: weight sum tolerance");
    expect_true(s.validation.max_ahp_criteria == 15, "settings: AHP criteria cap 15");

    s.validation.weight_sum_tolerance = 0.0;
    expect_throws_code([&] { s.validate_or_throw(); }, ErrorCode::InvalidConfig, "settings: zero tolerance rejected");

    s = EngineSettings::defaults();
    s.monte_carlo.samples = 0;
    expect_throws_code([&] { s.validate_or_throw(); }, ErrorCode::InvalidConfig, "settings: zero samples rejected");

    s = EngineSettings::defaults();
    s.sensitivity.weight_factors = {0.8, -1.0};
    expect_throws_code([&] { s.validate_or_throw(); }, ErrorCode::InvalidConfig, "settings: negative factor rejected");

    s = EngineSettings::defaults();
    s.validation.min_comparison_value = 2.0;
    expect_throws_code([&] { s.validate_or_throw(); }, ErrorCode::InvalidConfig, "settings: comparison bounds");
}

void test_error() {
    try {
        MCDA_REQUIRE(1 + 1 == 3, ErrorCode::NumericalFailure, "arithmetic broke");
        fail("error: MCDA_REQUIRE threw");
    } catch (const McdaError& e) {
        expect_true(e.code() == ErrorCode::NumericalFailure, "error: code carried");
        expect_eq_str(e.what(), "arithmetic broke", "error: what() is the bare message");
        expect_true(e.where().line > 0, "error: site recorded");
    }
    expect_eq_str(to_string(ErrorCode::DegenerateCriterion), "DegenerateCriterion", "error: code name");

    const McdaError empty(ErrorCode::InvalidInput, "");
    expect_eq_str(empty.what(), "<empty error message>", "error: empty message replaced");
}

void test_numeric() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    expect_near(safe_div(1.0, 0.0, -1.0), -1.0, 0.0, "numeric: divide by zero falls back");
    expect_near(safe_div(nan, 2.0), 0.0, 0.0, "numeric: NaN numerator falls back");
    expect_near(clamp01(1.5), 1.0, 0.0, "numeric: clamp01 high");
    expect_near(clamp01(-0.5), 0.0, 0.0, "numeric: clamp01 low");
    expect_near(safe_sqrt(-1e-18), 0.0, 0.0, "numeric: safe_sqrt of cancellation noise");
    expect_true(near(1.0, 1.0 + 1e-12) && !near(1.0, 1.001), "numeric: near");
}

void test_online_stats() {
    stats::OnlineStats st;
    for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) st.push(x);
    st.push(std::numeric_limits<double>::infinity());

    expect_true(st.n == 8, "stats: non-finite sample dropped");
    expect_near(st.mean, 5.0, 1e-12, "stats: mean");
    expect_near(st.stddev_population(), 2.0, 1e-12, "stats: population stddev");
    expect_near(st.variance_sample(), 32.0 / 7.0, 1e-12, "stats: sample variance");
    expect_near(st.min(), 2.0, 0.0, "stats: min");
    expect_near(st.max(), 9.0, 0.0, "stats: max");

    stats::OnlineStats one;
    one.push(3.0);
    expect_near(one.stddev_sample(), 0.0, 0.0, "stats: single sample has no spread");
}

void test_quantile() {
    const std::vector<double> xs{4.0, 1.0, 3.0, 2.0, 5.0};
    expect_near(stats::quantile(xs, 0.0), 1.0, 0.0, "quantile: min");
    expect_near(stats::quantile(xs, 1.0), 5.0, 0.0, "quantile: max");
    expect_near(stats::quantile(xs, 0.5), 3.0, 0.0, "quantile: median");
    expect_near(stats::quantile(xs, 0.125), 1.5, 1e-12, "quantile: interpolated");
    expect_near(stats::quantile({}, 0.5), 0.0, 0.0, "quantile: empty is 0");
}

void test_rng() {
    Rng64 a(12345);
    Rng64 b(12345);
    bool same = true;
    for (int i = 0; i < 100; ++i) same = same && a.next_u64() == b.next_u64();
    expect_true(same, "rng: same seed, same stream");

    Rng64 c(12346);
    expect_true(Rng64(12345).next_u64() != c.next_u64(), "rng: different seed, different stream");

    Rng64 z(0);
    expect_true(z.next_u64() != 0, "rng: zero seed remapped");

    Rng64 u(7);
    bool in_range = true;
    for (int i = 0; i < 1000; ++i) {
        const double x = u.next_u01();
        in_range = in_range && x > 0.0 && x < 1.0;
    }
    expect_true(in_range, "rng: u01 in (0,1)");

    Rng64 g(99);
    stats::OnlineStats st;
    for (int i = 0; i < 20000; ++i) st.push(g.next_normal());
    expect_near(st.mean, 0.0, 0.05, "rng: normal mean ~0");
    expect_near(st.stddev_sample(), 1.0, 0.05, "rng: normal stddev ~1");

    Rng64 t(5);
    bool clamped = true;
    for (int i = 0; i < 1000; ++i) {
        const double x = t.next_normal(1.0, 2.0, 0.0, 1.5);
        clamped = clamped && x >= 0.0 && x <= 1.5;
    }
    expect_true(clamped, "rng: truncated normal respects bounds");
}

void test_logging() {
    LogLevel lvl = LogLevel::INFO;
    expect_true(parse_log_level("debug", lvl) && lvl == LogLevel::DEBUG, "logging: parse debug");
    expect_true(parse_log_level("error", lvl) && lvl == LogLevel::ERROR, "logging: parse error");
    expect_true(!parse_log_level("verbose", lvl) && lvl == LogLevel::ERROR, "logging: unknown leaves value");

    const LogLevel before = get_log_level();
    set_log_level(LogLevel::WARN);
    expect_true(get_log_level() == LogLevel::WARN, "logging: level round-trips");
    set_log_level(before);
}

} // namespace

int main() {
    mcda::set_log_stderr_only(true);

    test_settings();
    test_error();
    test_numeric();
    test_online_stats();
    test_quantile();
    test_rng();
    test_logging();
    return mcda::selftest::finish();
}
