#include <tfd/description_parser.hpp>
#include <tfd/parse.hpp>
#include <tfd/render.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace tfd;

namespace {

  struct sample {
    date_fields date;
    time_fields time;
    offset_fields offset;
  };

  std::vector<sample>
  samples() {
    std::vector<sample> out;

    sample s;
    s.date = {2024, 3, 7, 67, day_of_week::thursday, 2024, 10, 9, 10};
    s.time = {13, 5, 9, 123'456'789};
    s.offset = {-5, -30, 0};
    out.push_back(s);

    s.date = {1999, 12, 31, 365, day_of_week::friday, 1999, 52, 52, 52};
    s.time = {0, 0, 0, 0};
    s.offset = {0, 0, 0};
    out.push_back(s);

    s.date = {2021, 1, 1, 1, day_of_week::friday, 2020, 53, 0, 0};
    s.time = {23, 59, 59, 500'000'000};
    s.offset = {9, 45, 0};
    out.push_back(s);

    s.date = {-44, 3, 15, 74, day_of_week::tuesday, -44, 11, 11, 11};
    s.time = {12, 30, 0, 1'000};
    s.offset = {0, -30, 0};
    out.push_back(s);

    return out;
  }

  parsed
  round_trip(std::string_view description, const sample& s) {
    auto d = compile(description, description_version::v2);
    auto values =
        field_values().with_date(s.date).with_time(s.time).with_offset(
            s.offset);
    return parse_exact(d, format(d, values));
  }

} // namespace

TEST_CASE("round trip: calendar date", "[round_trip]") {
  for (const auto& s : samples()) {
    auto p = round_trip("[year]-[month]-[day]", s);
    CHECK(p.year() == s.date.year);
    CHECK(p.month() == s.date.month);
    CHECK(p.day() == s.date.day);
  }
}

TEST_CASE("round trip: names and ordinals", "[round_trip]") {
  for (const auto& s : samples()) {
    auto p = round_trip(
        "[weekday], [month repr:long] [day padding:none] [year] ([ordinal])",
        s);
    CHECK(p.weekday() == s.date.weekday);
    CHECK(p.month() == s.date.month);
    CHECK(p.day() == s.date.day);
    CHECK(p.ordinal() == s.date.ordinal);
  }
}

TEST_CASE("round trip: iso week date", "[round_trip]") {
  for (const auto& s : samples()) {
    auto p = round_trip(
        "[year base:iso_week]-W[week_number]-[weekday repr:monday]", s);
    CHECK(p.iso_year() == s.date.iso_year);
    CHECK(p.iso_week_number() == s.date.iso_week);
    CHECK(p.weekday() == s.date.weekday);
  }
}

TEST_CASE("round trip: time with subseconds and offset", "[round_trip]") {
  for (const auto& s : samples()) {
    auto p = round_trip("[hour]:[minute]:[second].[subsecond digits:9]"
                        "[offset_hour sign:mandatory]:[offset_minute]",
                        s);
    CHECK(p.hour_24() == s.time.hour);
    CHECK(p.minute() == s.time.minute);
    CHECK(p.second() == s.time.second);
    CHECK(p.subsecond() == s.time.nanosecond);
    CHECK(p.offset_is_negative() == s.offset.is_negative());
    CHECK(p.offset_minute() ==
          static_cast<uint8_t>(s.offset.minutes < 0 ? -s.offset.minutes
                                                    : s.offset.minutes));
  }
}

TEST_CASE("round trip: twelve-hour clock", "[round_trip]") {
  for (const auto& s : samples()) {
    auto p = round_trip("[hour repr:12]:[minute] [period]", s);
    REQUIRE(p.hour_12());
    REQUIRE(p.hour_12_is_pm());
    auto hour = *p.hour_12() % 12 + (*p.hour_12_is_pm() ? 12 : 0);
    CHECK(hour == s.time.hour);
  }
}

TEST_CASE("round trip: optional and first", "[round_trip]") {
  auto d = compile("version = 2, [year]-[month]-[day]"
                   "[optional [T[hour]:[minute]]]"
                   "[first [Z] [[offset_hour sign:mandatory]]]");
  const auto s = samples().front();

  SECTION("everything available") {
    auto values =
        field_values().with_date(s.date).with_time(s.time).with_offset(
            s.offset);
    auto text = format(d, values);
    CHECK(text == "2024-03-07T13:05Z");
    auto p = parse_exact(d, text);
    CHECK(p.hour_24() == 13);
    CHECK(p.minute() == 5);
  }
  SECTION("date only") {
    auto text = format(d, field_values().with_date(s.date));
    CHECK(text == "2024-03-07Z");
    auto p = parse_exact(d, text);
    CHECK(p.day() == 7);
    CHECK_FALSE(p.hour_24().has_value());
  }
  SECTION("an offset written by hand takes the second alternative") {
    auto p = parse_exact(d, "2024-03-07T13:05-05");
    CHECK(p.offset_hour() == -5);
  }
}

TEST_CASE("round trip: unix timestamp", "[round_trip]") {
  auto d = compile("[unix_timestamp precision:microsecond]");
  for (int64_t seconds : {int64_t{0}, int64_t{1'700'000'000}, int64_t{-86'400}}) {
    timestamp_fields ts{seconds, 250'000};
    auto p = parse_exact(d, format(d, field_values().with_timestamp(ts)));
    CHECK(p.unix_timestamp_nanos() == seconds * 1'000'000'000 + 250'000);
  }
}
