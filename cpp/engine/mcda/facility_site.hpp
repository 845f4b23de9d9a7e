#pragma once
/*
================================================================================
Fragment 2.3 — MCDA: Facility Site Record + Criterion Extraction
FILE: cpp/engine/mcda/facility_site.hpp

Purpose:
  Plain record of what the surrounding application knows about a candidate
  facility (survey answers, techno-economic results, location), and the
  extraction rules that turn it into catalog criterion values.

Rules:
  - Unset optional fields return nullopt; AlternativeBuilder decides the
    fallback.
  - An id the catalog does not know throws McdaError(InvalidInput).
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>

namespace mcda {

struct SurveyData final {
  std::optional<double> operational_hours_day;
  std::optional<double> operational_hours_night;
  std::optional<int> support_staff;
  std::optional<int> technical_staff;
  std::optional<std::size_t> equipment_items;
  std::optional<double> catchment_population;
  std::optional<double> monthly_diesel_cost_usd;
  std::string electricity_reliability;  // free text from the survey form
};

struct TechnoEconomicData final {
  std::optional<double> pv_initial_cost_usd;
  std::optional<double> pv_lifecycle_cost_usd;
  std::optional<double> pv_npv_usd;
  std::optional<double> pv_irr_pct;
  std::optional<double> daily_usage_kwh;
  std::optional<double> peak_hours;
  std::optional<double> installed_cost_usd;
  std::optional<double> capacity_kw;
};

struct FacilitySite final {
  std::string id;
  std::string name;
  double latitude_deg = 0.0;

  std::optional<SurveyData> survey;
  std::optional<TechnoEconomicData> techno_economic;
};

// Map survey reliability text to 1 (none/very poor) .. 5 (very reliable).
// Unrecognized or empty text scores 3 (moderate).
double reliability_score(const std::string& text);

// Value of one catalog criterion for a facility.
std::optional<double> extract_facility_value(const FacilitySite& site, const std::string& criterion_id);

}  // namespace mcda
