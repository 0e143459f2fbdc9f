#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace tfd {

  enum class component_kind {
    day,
    month,
    ordinal,
    weekday,
    week_number,
    year,
    hour,
    minute,
    period,
    second,
    subsecond,
    offset_hour,
    offset_minute,
    offset_second,
    ignore,
    unix_timestamp,
    end,
  };

  enum class day_of_week {
    monday,
    tuesday,
    wednesday,
    thursday,
    friday,
    saturday,
    sunday,
  };

  // ---------------------------------------------------------------------------
  // Modifier values
  // ---------------------------------------------------------------------------

  enum class padding { zero, space, none };

  enum class month_repr { numerical, long_name, short_name };

  enum class weekday_repr { long_name, short_name, sunday, monday };

  enum class week_number_repr { iso, sunday, monday };

  enum class year_repr { full, century, last_two };

  enum class year_base { calendar, iso_week };

  // Extended allows up to six digits (full) or four (century) after a sign;
  // standard keeps years within four digits.
  enum class year_range { extended, standard };

  enum class hour_repr { twenty_four, twelve };

  enum class sign_mode { automatic, mandatory };

  enum class letter_case { upper, lower };

  enum class timestamp_precision { second, millisecond, microsecond, nanosecond };

  // What `end` does with input that remains when it is reached.
  enum class trailing_input { prohibit, discard };

  // Number of subsecond digits; zero means "one or more".
  using subsecond_digits = std::uint8_t;
  inline constexpr subsecond_digits one_or_more_digits = 0;

  // Resolved modifiers of a component. Only the members the component
  // declares in the component table are meaningful for it; the rest keep
  // their initial values so that equal descriptions compare equal.
  struct modifiers {
    padding pad = padding::zero;
    month_repr month = month_repr::numerical;
    weekday_repr weekday = weekday_repr::long_name;
    week_number_repr week_number = week_number_repr::iso;
    year_repr year = year_repr::full;
    year_range range = year_range::extended;
    year_base base = year_base::calendar;
    hour_repr hour = hour_repr::twenty_four;
    sign_mode sign = sign_mode::automatic;
    letter_case period_case = letter_case::upper;
    bool case_sensitive = true;
    bool one_indexed = true;
    subsecond_digits digits = one_or_more_digits;
    std::uint16_t count = 0;
    timestamp_precision precision = timestamp_precision::second;
    trailing_input trailing = trailing_input::prohibit;

    bool
    operator==(const modifiers&) const = default;
  };

  struct component_spec {
    component_kind kind = component_kind::day;
    modifiers mods;

    bool
    operator==(const component_spec&) const = default;
  };

  // Name used in format descriptions, e.g. "week_number".
  std::string_view
  to_string(component_kind kind);

  inline std::ostream&
  operator<<(std::ostream& os, component_kind kind) {
    return os << to_string(kind);
  }

} // namespace tfd
