#pragma once

#include <tfd/format_item.hpp>

namespace tfd {

  // Descriptions of standard formats, compiled once on first use.

  // 2024-03-07T13:05:09.5+01:00. Parses either case of `T` and `Z`; renders
  // `T`, the offset when one is available and `Z` otherwise. Fractional
  // seconds are rendered whenever a time of day is.
  const format_description&
  rfc3339();

  // Thu, 07 Mar 2024 13:05:09 +0100. The weekday and the seconds are
  // optional on parse, and a one-digit day is accepted.
  const format_description&
  rfc2822();

  // 2024-03-07T13:05:09.000000000+01:00 with nine fractional digits. Years
  // beyond four digits carry a sign.
  const format_description&
  iso8601();

} // namespace tfd
