/*
===============================================================================
Fragment 2.2 — MCDA: Alternative Builder (substitution policy)
File: cpp/engine/mcda/alternative_builder.cpp
===============================================================================
*/

#include "engine/mcda/alternative_builder.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

namespace mcda::detail {

double accept_or_substitute(const std::optional<double>& v,
                            const std::string& site_id,
                            const std::string& criterion_id,
                            BuildStats& stats) {
  if (v && is_finite(*v)) {
    ++stats.values_extracted;
    return *v;
  }
  ++stats.values_substituted;
  log(LogLevel::WARN, "alternative '" + site_id + "': no numeric value for '" + criterion_id +
                          "', using 0");
  return 0.0;
}

double substitute_after_throw(const std::string& site_id,
                              const std::string& criterion_id,
                              const char* what,
                              BuildStats& stats) {
  ++stats.values_substituted;
  log(LogLevel::WARN, "alternative '" + site_id + "': extraction of '" + criterion_id +
                          "' failed (" + (what ? what : "unknown error") + "), using 0");
  return 0.0;
}

} // namespace mcda::detail
