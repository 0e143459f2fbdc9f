#pragma once

#include <tfd/component.hpp>

#include <cstdint>
#include <optional>

namespace tfd {

  // Field values decoded by the parse interpreter. Each setter returns false
  // when the slot already holds a different value and leaves it unchanged;
  // storing an equal value again is accepted. Whether the fields are
  // sufficient or consistent for a particular date/time type is decided by
  // whoever converts them.
  class parsed {
  public:
    parsed() = default;

    std::optional<int32_t>
    year() const {
      return year_;
    }
    std::optional<int32_t>
    year_century() const {
      return year_century_;
    }
    // Distinguishes -00 from 00 in a century.
    std::optional<bool>
    year_century_is_negative() const {
      return year_century_is_negative_;
    }
    std::optional<uint8_t>
    year_last_two() const {
      return year_last_two_;
    }
    std::optional<int32_t>
    iso_year() const {
      return iso_year_;
    }
    std::optional<int32_t>
    iso_year_century() const {
      return iso_year_century_;
    }
    std::optional<bool>
    iso_year_century_is_negative() const {
      return iso_year_century_is_negative_;
    }
    std::optional<uint8_t>
    iso_year_last_two() const {
      return iso_year_last_two_;
    }
    std::optional<uint8_t>
    month() const {
      return month_;
    }
    std::optional<uint8_t>
    day() const {
      return day_;
    }
    std::optional<uint16_t>
    ordinal() const {
      return ordinal_;
    }
    std::optional<day_of_week>
    weekday() const {
      return weekday_;
    }
    std::optional<uint8_t>
    iso_week_number() const {
      return iso_week_number_;
    }
    std::optional<uint8_t>
    sunday_week_number() const {
      return sunday_week_number_;
    }
    std::optional<uint8_t>
    monday_week_number() const {
      return monday_week_number_;
    }
    std::optional<uint8_t>
    hour_24() const {
      return hour_24_;
    }
    std::optional<uint8_t>
    hour_12() const {
      return hour_12_;
    }
    std::optional<bool>
    hour_12_is_pm() const {
      return hour_12_is_pm_;
    }
    std::optional<uint8_t>
    minute() const {
      return minute_;
    }
    std::optional<uint8_t>
    second() const {
      return second_;
    }
    std::optional<uint32_t>
    subsecond() const {
      return subsecond_;
    }
    std::optional<int8_t>
    offset_hour() const {
      return offset_hour_;
    }
    std::optional<uint8_t>
    offset_minute() const {
      return offset_minute_;
    }
    std::optional<uint8_t>
    offset_second() const {
      return offset_second_;
    }
    // Distinguishes -00 from +00 in the offset hour.
    std::optional<bool>
    offset_is_negative() const {
      return offset_is_negative_;
    }
    std::optional<int64_t>
    unix_timestamp_nanos() const {
      return unix_timestamp_nanos_;
    }

    bool
    set_year(int32_t v) {
      return assign(year_, v);
    }
    bool
    set_year_century(int32_t v) {
      return assign(year_century_, v);
    }
    bool
    set_year_century_is_negative(bool v) {
      return assign(year_century_is_negative_, v);
    }
    bool
    set_year_last_two(uint8_t v) {
      return assign(year_last_two_, v);
    }
    bool
    set_iso_year(int32_t v) {
      return assign(iso_year_, v);
    }
    bool
    set_iso_year_century(int32_t v) {
      return assign(iso_year_century_, v);
    }
    bool
    set_iso_year_century_is_negative(bool v) {
      return assign(iso_year_century_is_negative_, v);
    }
    bool
    set_iso_year_last_two(uint8_t v) {
      return assign(iso_year_last_two_, v);
    }
    bool
    set_month(uint8_t v) {
      return assign(month_, v);
    }
    bool
    set_day(uint8_t v) {
      return assign(day_, v);
    }
    bool
    set_ordinal(uint16_t v) {
      return assign(ordinal_, v);
    }
    bool
    set_weekday(day_of_week v) {
      return assign(weekday_, v);
    }
    bool
    set_iso_week_number(uint8_t v) {
      return assign(iso_week_number_, v);
    }
    bool
    set_sunday_week_number(uint8_t v) {
      return assign(sunday_week_number_, v);
    }
    bool
    set_monday_week_number(uint8_t v) {
      return assign(monday_week_number_, v);
    }
    bool
    set_hour_24(uint8_t v) {
      return assign(hour_24_, v);
    }
    bool
    set_hour_12(uint8_t v) {
      return assign(hour_12_, v);
    }
    bool
    set_hour_12_is_pm(bool v) {
      return assign(hour_12_is_pm_, v);
    }
    bool
    set_minute(uint8_t v) {
      return assign(minute_, v);
    }
    bool
    set_second(uint8_t v) {
      return assign(second_, v);
    }
    bool
    set_subsecond(uint32_t v) {
      return assign(subsecond_, v);
    }
    bool
    set_offset_hour(int8_t v) {
      return assign(offset_hour_, v);
    }
    bool
    set_offset_minute(uint8_t v) {
      return assign(offset_minute_, v);
    }
    bool
    set_offset_second(uint8_t v) {
      return assign(offset_second_, v);
    }
    bool
    set_offset_is_negative(bool v) {
      return assign(offset_is_negative_, v);
    }
    bool
    set_unix_timestamp_nanos(int64_t v) {
      return assign(unix_timestamp_nanos_, v);
    }

    bool
    operator==(const parsed&) const = default;

  private:
    std::optional<int32_t> year_;
    std::optional<int32_t> year_century_;
    std::optional<bool> year_century_is_negative_;
    std::optional<uint8_t> year_last_two_;
    std::optional<int32_t> iso_year_;
    std::optional<int32_t> iso_year_century_;
    std::optional<bool> iso_year_century_is_negative_;
    std::optional<uint8_t> iso_year_last_two_;
    std::optional<uint8_t> month_;
    std::optional<uint8_t> day_;
    std::optional<uint16_t> ordinal_;
    std::optional<day_of_week> weekday_;
    std::optional<uint8_t> iso_week_number_;
    std::optional<uint8_t> sunday_week_number_;
    std::optional<uint8_t> monday_week_number_;
    std::optional<uint8_t> hour_24_;
    std::optional<uint8_t> hour_12_;
    std::optional<bool> hour_12_is_pm_;
    std::optional<uint8_t> minute_;
    std::optional<uint8_t> second_;
    std::optional<uint32_t> subsecond_;
    std::optional<int8_t> offset_hour_;
    std::optional<uint8_t> offset_minute_;
    std::optional<uint8_t> offset_second_;
    std::optional<bool> offset_is_negative_;
    std::optional<int64_t> unix_timestamp_nanos_;

    template <typename T>
    static bool
    assign(std::optional<T>& slot, T value) {
      if (slot && *slot != value) return false;
      slot = value;
      return true;
    }
  };

} // namespace tfd
