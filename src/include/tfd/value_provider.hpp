#pragma once

#include <tfd/component.hpp>

#include <cstdint>
#include <optional>

namespace tfd {

  // Calendar date fields, including the derived ones a description may ask
  // for. Computing them is the job of the calendar type supplying them.
  struct date_fields {
    int32_t year = 1970;
    uint8_t month = 1;
    uint8_t day = 1;
    uint16_t ordinal = 1;
    day_of_week weekday = day_of_week::thursday;
    int32_t iso_year = 1970;
    uint8_t iso_week = 1;
    uint8_t sunday_week = 0;
    uint8_t monday_week = 0;

    bool
    operator==(const date_fields&) const = default;
  };

  struct time_fields {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint32_t nanosecond = 0;

    bool
    operator==(const time_fields&) const = default;
  };

  // A UTC offset split into parts that all carry the offset's sign.
  struct offset_fields {
    int8_t hours = 0;
    int8_t minutes = 0;
    int8_t seconds = 0;

    bool
    is_negative() const {
      return hours < 0 || minutes < 0 || seconds < 0;
    }

    bool
    operator==(const offset_fields&) const = default;
  };

  struct timestamp_fields {
    int64_t seconds = 0;
    uint32_t nanosecond = 0;

    bool
    operator==(const timestamp_fields&) const = default;
  };

  // Source of field values for the render interpreter. A provider returns
  // nullopt for a group it structurally does not have (a plain date has no
  // time of day).
  class value_provider {
  public:
    virtual ~value_provider() = default;

    virtual std::optional<date_fields>
    date() const = 0;

    virtual std::optional<time_fields>
    time() const = 0;

    virtual std::optional<offset_fields>
    offset() const = 0;

    virtual std::optional<timestamp_fields>
    timestamp() const = 0;
  };

  // A provider over already decomposed fields.
  class field_values : public value_provider {
  public:
    field_values() = default;

    field_values&
    with_date(const date_fields& d) {
      date_ = d;
      return *this;
    }

    field_values&
    with_time(const time_fields& t) {
      time_ = t;
      return *this;
    }

    field_values&
    with_offset(const offset_fields& o) {
      offset_ = o;
      return *this;
    }

    field_values&
    with_timestamp(const timestamp_fields& ts) {
      timestamp_ = ts;
      return *this;
    }

    std::optional<date_fields>
    date() const override {
      return date_;
    }

    std::optional<time_fields>
    time() const override {
      return time_;
    }

    std::optional<offset_fields>
    offset() const override {
      return offset_;
    }

    std::optional<timestamp_fields>
    timestamp() const override {
      return timestamp_;
    }

  private:
    std::optional<date_fields> date_;
    std::optional<time_fields> time_;
    std::optional<offset_fields> offset_;
    std::optional<timestamp_fields> timestamp_;
  };

} // namespace tfd
