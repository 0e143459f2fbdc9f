#pragma once

#include <tfd/component.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace tfd {

  // One legal modifier key of a component. A rule either enumerates its
  // accepted values or, when values is empty, accepts a decimal number in
  // [min, max].
  struct modifier_rule {
    std::string_view key;
    std::span<const std::string_view> values;
    std::string_view default_value;
    bool required = false;
    std::uint32_t min = 0;
    std::uint32_t max = 0;
  };

  struct component_rule {
    std::string_view name;
    component_kind kind;
    std::span<const modifier_rule> modifiers;
  };

  // Every component the description language knows, in declaration order of
  // component_kind.
  std::span<const component_rule>
  component_rules();

  const component_rule*
  find_component(std::string_view name);

  const component_rule&
  rule_for(component_kind kind);

  const modifier_rule*
  find_modifier(const component_rule& rule, std::string_view key);

  bool
  accepts_value(const modifier_rule& rule, std::string_view value);

  // Store an accepted key/value pair into spec.mods.
  void
  apply_modifier(component_spec& spec, std::string_view key,
                 std::string_view value);

  // A component with every modifier at its documented default. Required
  // modifiers are left at their zero value.
  component_spec
  default_component(component_kind kind);

  // Minimum width of a padded numeric component, 0 if it is not padded.
  std::size_t
  padded_width(const component_spec& spec);

  // English names indexed by month number - 1.
  std::span<const std::string_view>
  month_names(month_repr repr);

  // English names indexed by day_of_week.
  std::span<const std::string_view>
  weekday_names(weekday_repr repr);

  inline constexpr std::string_view period_names_upper[] = {"AM", "PM"};
  inline constexpr std::string_view period_names_lower[] = {"am", "pm"};

} // namespace tfd
