#include <tfd/well_known.hpp>

#include <tfd/description_parser.hpp>

namespace tfd {

  const format_description&
  rfc3339() {
    static const format_description description = compile(
        "[year range:standard]-[month]-[day][first [T] [t]]"
        "[hour]:[minute]:[second][optional [.[subsecond]]]"
        "[first [[offset_hour sign:mandatory]:[offset_minute]] [Z] [z]]",
        description_version::v2);
    return description;
  }

  const format_description&
  rfc2822() {
    static const format_description description = compile(
        "[optional [[weekday repr:short], ]]"
        "[first [[day]] [[day padding:none]]] [month repr:short] "
        "[year range:standard] [hour]:[minute][optional [:[second]]] "
        "[offset_hour sign:mandatory][offset_minute]",
        description_version::v2);
    return description;
  }

  const format_description&
  iso8601() {
    static const format_description description = compile(
        "[year]-[month]-[day]T[hour]:[minute]:[second].[subsecond digits:9]"
        "[first [[offset_hour sign:mandatory]:[offset_minute]] [Z]]",
        description_version::v2);
    return description;
  }

} // namespace tfd
