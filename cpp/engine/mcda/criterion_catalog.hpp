#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/mcda/types.hpp"

namespace mcda {

enum class CriterionSource : std::uint8_t {
  Survey = 0,
  TechnoEconomic = 1,
  Facility = 2
};

const char* to_string(CriterionSource s) noexcept;

struct CriterionSpec final {
  std::string_view id;
  std::string_view name;
  std::string_view description;
  Direction direction = Direction::Benefit;
  CriterionSource source = CriterionSource::Survey;
  std::string_view unit;
};

/// Static registry of the criteria an analysis may select.
/// Used to decorate output and to supply each criterion's direction; an id
/// that is not here is rejected by the request validator, never defaulted.
class CriterionCatalog final {
 public:
  /// nullopt when `id` is not registered.
  static std::optional<CriterionSpec> lookup(std::string_view id);

  static bool contains(std::string_view id) { return lookup(id).has_value(); }

  /// Every entry, in registry order.
  static const std::vector<CriterionSpec>& all();
};

}  // namespace mcda
