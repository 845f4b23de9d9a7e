/*
===============================================================================
Fragment 2.2 — MCDA: Alternative Builder (Site Records -> Decision Rows)
File: cpp/engine/mcda/alternative_builder.hpp
===============================================================================

Turns caller-owned site records into Alternatives, one value per requested
criterion. The builder does not know where values come from; the caller
supplies two callables:
  - identity:  Site -> {id, name}
  - extractor: (Site, criterion id) -> optional<double>

Fail-soft boundary:
  - extractor throws, returns nullopt, or returns NaN/Inf => value 0, WARN log,
    batch continues. Non-std exceptions are treated the same way.
  - identity() is not guarded: a site without an id cannot become a row, so
    its exception reaches the caller.
  - This is the ONLY place in the engine that substitutes a default value.
    AHP/TOPSIS/validator never do.

Deterministic: output order == input order, values keyed by criterion id.
===============================================================================
*/

#pragma once

#include "engine/mcda/types.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcda {

struct SiteIdentity final {
  std::string id;
  std::string name;
};

template <typename Site>
using IdentityFn = std::function<SiteIdentity(const Site&)>;

template <typename Site>
using ValueExtractor = std::function<std::optional<double>(const Site&, const std::string&)>;

struct BuildStats final {
  std::size_t values_extracted = 0;
  std::size_t values_substituted = 0;  // extraction failures replaced by 0
};

namespace detail {

// Returns the value to store, logging when a substitution happens.
double accept_or_substitute(const std::optional<double>& v,
                            const std::string& site_id,
                            const std::string& criterion_id,
                            BuildStats& stats);

double substitute_after_throw(const std::string& site_id,
                              const std::string& criterion_id,
                              const char* what,
                              BuildStats& stats);

} // namespace detail

template <typename Site>
std::vector<Alternative> build_alternatives(const std::vector<Site>& sites,
                                            const std::vector<std::string>& criterion_ids,
                                            const IdentityFn<Site>& identity,
                                            const ValueExtractor<Site>& extractor,
                                            BuildStats* stats_out = nullptr) {
  BuildStats stats;
  std::vector<Alternative> out;
  out.reserve(sites.size());

  for (const Site& site : sites) {
    SiteIdentity ident = identity(site);

    Alternative alt;
    alt.id = std::move(ident.id);
    alt.name = std::move(ident.name);

    for (const std::string& cid : criterion_ids) {
      double v = 0.0;
      try {
        v = detail::accept_or_substitute(extractor(site, cid), alt.id, cid, stats);
      } catch (const std::exception& e) {
        v = detail::substitute_after_throw(alt.id, cid, e.what(), stats);
      } catch (...) {
        v = detail::substitute_after_throw(alt.id, cid, nullptr, stats);
      }
      alt.values[cid] = v;
    }
    out.push_back(std::move(alt));
  }

  if (stats_out) *stats_out = stats;
  return out;
}

// ---- Ready-made callables for rows whose values are already resolved ----

inline SiteIdentity identity_of(const Alternative& a) {
  return SiteIdentity{a.id, a.name.empty() ? a.id : a.name};
}

inline std::optional<double> mapped_value(const Alternative& a, const std::string& criterion_id) {
  return a.value_of(criterion_id);
}

} // namespace mcda
