#include "engine/mcda/facility_site.hpp"

#include "engine/core/error.hpp"
#include "engine/mcda/criterion_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace mcda {
namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool has(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

template <typename T>
std::optional<double> as_double(const std::optional<T>& v) {
  if (!v) return std::nullopt;
  return static_cast<double>(*v);
}

}  // namespace

double reliability_score(const std::string& text) {
  const std::string t = lower(text);
  // Most specific phrases first: "unreliable" contains "reliable".
  if (has(t, "very poor") || has(t, "none")) return 1.0;
  if (has(t, "unreliable") || has(t, "poor")) return 2.0;
  if (has(t, "very reliable") || has(t, "excellent")) return 5.0;
  if (has(t, "reliable") || has(t, "good")) return 4.0;
  if (has(t, "moderate") || has(t, "fair")) return 3.0;
  return 3.0;
}

std::optional<double> extract_facility_value(const FacilitySite& site, const std::string& id) {
  MCDA_REQUIRE(CriterionCatalog::contains(id), ErrorCode::InvalidInput, "unknown criterion: " + id);

  if (id == "latitude") return std::fabs(site.latitude_deg);

  if (id == "operational_hours_day" || id == "operational_hours_night" || id == "staff_total" ||
      id == "equipment_count" || id == "catchment_population" || id == "monthly_diesel_cost" ||
      id == "electricity_reliability_score") {
    if (!site.survey) return std::nullopt;
    const SurveyData& s = *site.survey;

    if (id == "operational_hours_day") return s.operational_hours_day;
    if (id == "operational_hours_night") return s.operational_hours_night;
    if (id == "staff_total") {
      if (!s.support_staff && !s.technical_staff) return std::nullopt;
      return static_cast<double>(s.support_staff.value_or(0) + s.technical_staff.value_or(0));
    }
    if (id == "equipment_count") return as_double(s.equipment_items);
    if (id == "catchment_population") return s.catchment_population;
    if (id == "monthly_diesel_cost") return s.monthly_diesel_cost_usd;
    return reliability_score(s.electricity_reliability);
  }

  if (!site.techno_economic) return std::nullopt;
  const TechnoEconomicData& te = *site.techno_economic;

  if (id == "pv_initial_cost") return te.pv_initial_cost_usd;
  if (id == "pv_lifecycle_cost") return te.pv_lifecycle_cost_usd;
  if (id == "pv_npv") return te.pv_npv_usd;
  if (id == "pv_irr") return te.pv_irr_pct;
  if (id == "daily_usage") return te.daily_usage_kwh;
  if (id == "peak_hours") return te.peak_hours;
  if (id == "cost_usd") return te.installed_cost_usd;
  if (id == "capacity_kw") return te.capacity_kw;

  fail(ErrorCode::InvalidInput, "no extraction rule for criterion: " + id, MCDA_SITE);
}

}  // namespace mcda
