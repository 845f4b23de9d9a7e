#include "engine/mcda/criterion_catalog.hpp"

#include <unordered_map>

namespace mcda {
namespace {

const std::unordered_map<std::string_view, std::size_t>& index_by_id() {
  // string_view keys point into the static table below, lifetime is static.
  static const std::unordered_map<std::string_view, std::size_t> k = [] {
    std::unordered_map<std::string_view, std::size_t> m;
    const auto& entries = CriterionCatalog::all();
    for (std::size_t i = 0; i < entries.size(); ++i) m.emplace(entries[i].id, i);
    return m;
  }();
  return k;
}

}  // namespace

const char* to_string(CriterionSource s) noexcept {
  switch (s) {
    case CriterionSource::Survey:         return "survey";
    case CriterionSource::TechnoEconomic: return "techno_economic";
    case CriterionSource::Facility:       return "facility";
    default:                              return "unknown";
  }
}

const std::vector<CriterionSpec>& CriterionCatalog::all() {
  using D = Direction;
  using S = CriterionSource;
  static const std::vector<CriterionSpec> k = {
      // ---- Survey ----
      {"operational_hours_day", "Daily Operational Hours", "Average operational hours during day",
       D::Benefit, S::Survey, "hours"},
      {"operational_hours_night", "Night Operational Hours", "Average operational hours during night",
       D::Benefit, S::Survey, "hours"},
      {"staff_total", "Total Staff Count", "Total number of support and technical staff",
       D::Benefit, S::Survey, "people"},
      {"equipment_count", "Equipment Count", "Number of electrical equipment items",
       D::Benefit, S::Survey, "items"},
      {"catchment_population", "Catchment Population", "Population served by the facility",
       D::Benefit, S::Survey, "people"},
      {"monthly_diesel_cost", "Monthly Diesel Cost", "Monthly cost of diesel fuel",
       D::Cost, S::Survey, "USD"},
      {"electricity_reliability_score", "Electricity Reliability Score",
       "Reliability of current electricity source (1-5 scale)", D::Benefit, S::Survey, "score"},

      // ---- Techno-economic ----
      {"pv_initial_cost", "PV Initial Cost", "Initial investment cost for PV system",
       D::Cost, S::TechnoEconomic, "USD"},
      {"pv_lifecycle_cost", "PV Lifecycle Cost", "Total lifecycle cost of PV system",
       D::Cost, S::TechnoEconomic, "USD"},
      {"pv_npv", "PV Net Present Value", "Net present value of PV investment",
       D::Benefit, S::TechnoEconomic, "USD"},
      {"pv_irr", "PV Internal Rate of Return", "Internal rate of return for PV investment",
       D::Benefit, S::TechnoEconomic, "%"},
      {"daily_usage", "Daily Energy Usage", "Estimated daily energy consumption",
       D::Benefit, S::TechnoEconomic, "kWh"},
      {"peak_hours", "Peak Hours", "Peak power demand hours",
       D::Benefit, S::TechnoEconomic, "hours"},
      {"cost_usd", "Cost", "Total installed cost of the candidate system",
       D::Cost, S::TechnoEconomic, "USD"},
      {"capacity_kw", "Capacity", "Installable PV capacity at the site",
       D::Benefit, S::TechnoEconomic, "kW"},

      // ---- Location ----
      {"latitude", "Latitude", "Geographic latitude (solar resource indicator)",
       D::Benefit, S::Facility, "degrees"},
  };
  return k;
}

std::optional<CriterionSpec> CriterionCatalog::lookup(std::string_view id) {
  const auto& idx = index_by_id();
  auto it = idx.find(id);
  if (it == idx.end()) return std::nullopt;
  return all()[it->second];
}

}  // namespace mcda
