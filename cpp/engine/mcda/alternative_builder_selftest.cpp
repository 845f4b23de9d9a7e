/*
===============================================================================
Fragment 2.2.T — Catalog / Facility Extraction / Builder Selftest
File: cpp/engine/mcda/alternative_builder_selftest.cpp
===============================================================================

Covers:
  - catalog lookup + directions
  - facility extraction rules (staff sum, reliability text, |latitude|)
  - builder substitution policy (nullopt / NaN / throw => 0, counted)
  - input order preserved

Run: ./alternative_builder_selftest
===============================================================================
*/

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/mcda/alternative_builder.hpp"
#include "engine/mcda/criterion_catalog.hpp"
#include "engine/mcda/facility_site.hpp"

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace mcda;
using namespace mcda::selftest;

void test_catalog() {
  expect_true(CriterionCatalog::all().size() == 16, "catalog: 16 registered criteria");

  const auto cost = CriterionCatalog::lookup("cost_usd");
  expect_true(cost.has_value() && cost->direction == Direction::Cost, "catalog: cost_usd is a cost");
  const auto cap = CriterionCatalog::lookup("capacity_kw");
  expect_true(cap.has_value() && cap->direction == Direction::Benefit, "catalog: capacity_kw is a benefit");
  const auto diesel = CriterionCatalog::lookup("monthly_diesel_cost");
  expect_true(diesel.has_value() && diesel->source == CriterionSource::Survey, "catalog: diesel cost from survey");

  expect_true(!CriterionCatalog::contains("bogus"), "catalog: unknown id absent");
  expect_true(!CriterionCatalog::contains("COST_USD"), "catalog: ids are case sensitive");
}

FacilitySite sample_facility() {
  FacilitySite f;
  f.id = "hc-01";
  f.name = "Health Centre 1";
  f.latitude_deg = -13.25;

  SurveyData s;
  s.support_staff = 4;
  s.technical_staff = 2;
  s.equipment_items = 12;
  s.operational_hours_day = 10.0;
  s.electricity_reliability = "Unreliable, frequent outages";
  f.survey = s;

  TechnoEconomicData te;
  te.pv_npv_usd = 18000.0;
  te.capacity_kw = 7.5;
  f.techno_economic = te;
  return f;
}

void test_facility_extraction() {
  const FacilitySite f = sample_facility();

  const auto staff = extract_facility_value(f, "staff_total");
  expect_true(staff && *staff == 6.0, "facility: staff_total sums both staff groups");
  const auto lat = extract_facility_value(f, "latitude");
  expect_true(lat && *lat == 13.25, "facility: latitude is absolute");
  const auto rel = extract_facility_value(f, "electricity_reliability_score");
  expect_true(rel && *rel == 2.0, "facility: 'unreliable' scores 2");
  const auto eq = extract_facility_value(f, "equipment_count");
  expect_true(eq && *eq == 12.0, "facility: equipment count");
  const auto cap = extract_facility_value(f, "capacity_kw");
  expect_true(cap && *cap == 7.5, "facility: capacity from techno-economic");

  expect_true(!extract_facility_value(f, "pv_irr").has_value(), "facility: unset field is nullopt");

  FacilitySite bare;
  bare.id = "bare";
  expect_true(!extract_facility_value(bare, "staff_total").has_value(), "facility: no survey => nullopt");
  expect_true(!extract_facility_value(bare, "pv_npv").has_value(), "facility: no techno-economic => nullopt");

  expect_throws_code([&] { (void)extract_facility_value(f, "bogus"); }, ErrorCode::InvalidInput,
                     "facility: unknown criterion throws");
}

void test_reliability_text() {
  expect_near(reliability_score("Very reliable"), 5.0, 0.0, "reliability: very reliable");
  expect_near(reliability_score("GOOD"), 4.0, 0.0, "reliability: case-insensitive good");
  expect_near(reliability_score("very poor"), 1.0, 0.0, "reliability: very poor");
  expect_near(reliability_score("none"), 1.0, 0.0, "reliability: none");
  expect_near(reliability_score("fair"), 3.0, 0.0, "reliability: fair");
  expect_near(reliability_score(""), 3.0, 0.0, "reliability: empty defaults to moderate");
}

void test_builder_substitution() {
  const FacilitySite good = sample_facility();
  FacilitySite partial;
  partial.id = "hc-02";
  partial.name = "Health Centre 2";

  const std::vector<FacilitySite> sites{good, partial};
  const std::vector<std::string> crit{"staff_total", "capacity_kw"};

  BuildStats stats;
  const auto alts = build_alternatives<FacilitySite>(
      sites, crit,
      [](const FacilitySite& f) { return SiteIdentity{f.id, f.name}; },
      [](const FacilitySite& f, const std::string& id) { return extract_facility_value(f, id); }, &stats);

  expect_true(alts.size() == 2, "builder: one row per site");
  expect_true(alts[0].id == "hc-01" && alts[1].id == "hc-02", "builder: input order preserved");
  expect_true(alts[0].values.at("staff_total") == 6.0, "builder: extracted value kept");
  expect_true(alts[1].values.at("staff_total") == 0.0 && alts[1].values.at("capacity_kw") == 0.0,
              "builder: missing values become 0");
  expect_true(stats.values_extracted == 2 && stats.values_substituted == 2, "builder: stats counted");
}

void test_builder_nan_and_throw() {
  struct Row {
    std::string id;
    int mode;
  };
  const std::vector<Row> rows{{"nan", 0}, {"throws", 1}, {"ok", 2}};

  BuildStats stats;
  const auto alts = build_alternatives<Row>(
      rows, {"x"},
      [](const Row& r) { return SiteIdentity{r.id, r.id}; },
      [](const Row& r, const std::string&) -> std::optional<double> {
        if (r.mode == 0) return std::numeric_limits<double>::quiet_NaN();
        if (r.mode == 1) throw std::runtime_error("lookup failed");
        return 3.5;
      },
      &stats);

  expect_true(alts.size() == 3, "builder: batch continues past failures");
  expect_true(alts[0].values.at("x") == 0.0, "builder: NaN becomes 0");
  expect_true(alts[1].values.at("x") == 0.0, "builder: throwing extractor becomes 0");
  expect_true(alts[2].values.at("x") == 3.5, "builder: good row untouched");
  expect_true(stats.values_substituted == 2 && stats.values_extracted == 1, "builder: two substitutions");
}

void test_builder_non_std_throw() {
  const std::vector<std::string> ids{"a", "b", "c"};

  BuildStats stats;
  const auto alts = build_alternatives<std::string>(
      ids, {"x"},
      [](const std::string& id) { return SiteIdentity{id, id}; },
      [](const std::string& id, const std::string&) -> std::optional<double> {
        if (id == "b") throw 42;
        return 1.0;
      },
      &stats);

  expect_true(alts.size() == 3, "builder: non-std throw does not abort the batch");
  expect_true(alts.size() == 3 && alts[1].id == "b" && alts[1].values.at("x") == 0.0,
              "builder: non-std throw becomes 0");
  expect_true(alts.size() == 3 && alts[2].values.at("x") == 1.0, "builder: rows after the throw still built");
  expect_true(stats.values_substituted == 1 && stats.values_extracted == 2, "builder: non-std throw counted");
}

void test_builder_passthrough() {
  Alternative a;
  a.id = "A";
  a.values["cost_usd"] = 100.0;
  const std::vector<Alternative> in{a};

  const auto out = build_alternatives<Alternative>(in, {"cost_usd", "capacity_kw"}, identity_of, mapped_value);
  expect_eq_str(out[0].name, "A", "passthrough: name defaults to id");
  expect_true(out[0].values.at("cost_usd") == 100.0 && out[0].values.at("capacity_kw") == 0.0,
              "passthrough: resolved kept, absent substituted");
}

}  // namespace

int main() {
  mcda::set_log_level(mcda::LogLevel::ERROR);

  test_catalog();
  test_facility_extraction();
  test_reliability_text();
  test_builder_substitution();
  test_builder_nan_and_throw();
  test_builder_non_std_throw();
  test_builder_passthrough();
  return mcda::selftest::finish();
}
