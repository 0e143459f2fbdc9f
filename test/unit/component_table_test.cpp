#include <tfd/component_table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace tfd;

TEST_CASE("component rules are indexed by kind", "[component_table]") {
  for (const auto& rule : component_rules()) {
    CHECK(&rule_for(rule.kind) == &rule);
    CHECK(find_component(rule.name) == &rule);
    CHECK(to_string(rule.kind) == rule.name);
  }
  CHECK(component_rules().size() == 17);
}

TEST_CASE("unknown component names", "[component_table]") {
  CHECK(find_component("foo") == nullptr);
  CHECK(find_component("years") == nullptr);
  CHECK(find_component("") == nullptr);
  CHECK(find_component("optional") == nullptr);
}

TEST_CASE("names, keys and values ignore ASCII case", "[component_table]") {
  CHECK(find_component("Year") == &rule_for(component_kind::year));
  CHECK(find_component("WEEK_NUMBER") ==
        &rule_for(component_kind::week_number));

  const auto& month = rule_for(component_kind::month);
  const auto* repr = find_modifier(month, "Repr");
  REQUIRE(repr);
  CHECK(repr->key == "repr");
  CHECK(accepts_value(*repr, "SHORT"));
  CHECK(accepts_value(*repr, "Long"));
  CHECK_FALSE(accepts_value(*repr, "shorter"));

  auto spec = default_component(component_kind::month);
  apply_modifier(spec, "REPR", "Short");
  apply_modifier(spec, "Case_Sensitive", "FALSE");
  CHECK(spec.mods.month == month_repr::short_name);
  CHECK_FALSE(spec.mods.case_sensitive);
}

TEST_CASE("modifier lookup", "[component_table]") {
  const auto& day = rule_for(component_kind::day);
  CHECK(find_modifier(day, "padding") != nullptr);
  CHECK(find_modifier(day, "sign") == nullptr);
  CHECK(find_modifier(day, "repr") == nullptr);

  const auto& year = rule_for(component_kind::year);
  CHECK(find_modifier(year, "repr") != nullptr);
  CHECK(find_modifier(year, "base") != nullptr);
  CHECK(find_modifier(year, "sign") != nullptr);
  CHECK(find_modifier(year, "range") != nullptr);

  const auto& end = rule_for(component_kind::end);
  REQUIRE(end.modifiers.size() == 1);
  CHECK(end.modifiers[0].key == "trailing_input");
}

TEST_CASE("accepted modifier values", "[component_table]") {
  SECTION("enumerated") {
    const auto* pad = find_modifier(rule_for(component_kind::day), "padding");
    REQUIRE(pad);
    CHECK(accepts_value(*pad, "zero"));
    CHECK(accepts_value(*pad, "space"));
    CHECK(accepts_value(*pad, "none"));
    CHECK(accepts_value(*pad, "Zero"));
    CHECK_FALSE(accepts_value(*pad, "zeros"));
    CHECK_FALSE(accepts_value(*pad, ""));
  }
  SECTION("numeric range") {
    const auto* count =
        find_modifier(rule_for(component_kind::ignore), "count");
    REQUIRE(count);
    CHECK(count->required);
    CHECK(accepts_value(*count, "1"));
    CHECK(accepts_value(*count, "65535"));
    CHECK_FALSE(accepts_value(*count, "0"));
    CHECK_FALSE(accepts_value(*count, "65536"));
    CHECK_FALSE(accepts_value(*count, "-1"));
    CHECK_FALSE(accepts_value(*count, "1x"));
    CHECK_FALSE(accepts_value(*count, "99999999999"));
  }
  SECTION("subsecond digits") {
    const auto* digits =
        find_modifier(rule_for(component_kind::subsecond), "digits");
    REQUIRE(digits);
    CHECK(accepts_value(*digits, "1+"));
    CHECK(accepts_value(*digits, "9"));
    CHECK_FALSE(accepts_value(*digits, "10"));
    CHECK_FALSE(accepts_value(*digits, "0"));
  }
}

TEST_CASE("default components", "[component_table]") {
  SECTION("every optional modifier resolves to its default") {
    auto year = default_component(component_kind::year);
    CHECK(year.kind == component_kind::year);
    CHECK(year.mods.pad == padding::zero);
    CHECK(year.mods.year == year_repr::full);
    CHECK(year.mods.base == year_base::calendar);
    CHECK(year.mods.sign == sign_mode::automatic);
    CHECK(year.mods.range == year_range::extended);
  }
  SECTION("end prohibits trailing input by default") {
    CHECK(default_component(component_kind::end).mods.trailing ==
          trailing_input::prohibit);
  }
  SECTION("weekday defaults") {
    auto weekday = default_component(component_kind::weekday);
    CHECK(weekday.mods.weekday == weekday_repr::long_name);
    CHECK(weekday.mods.one_indexed);
    CHECK(weekday.mods.case_sensitive);
  }
  SECTION("required modifiers are left unset") {
    CHECK(default_component(component_kind::ignore).mods.count == 0);
  }
}

TEST_CASE("apply_modifier", "[component_table]") {
  auto spec = default_component(component_kind::hour);
  apply_modifier(spec, "repr", "12");
  apply_modifier(spec, "padding", "space");
  CHECK(spec.mods.hour == hour_repr::twelve);
  CHECK(spec.mods.pad == padding::space);

  auto sub = default_component(component_kind::subsecond);
  CHECK(sub.mods.digits == one_or_more_digits);
  apply_modifier(sub, "digits", "3");
  CHECK(sub.mods.digits == 3);

  auto year = default_component(component_kind::year);
  apply_modifier(year, "range", "standard");
  CHECK(year.mods.range == year_range::standard);

  auto end = default_component(component_kind::end);
  apply_modifier(end, "trailing_input", "discard");
  CHECK(end.mods.trailing == trailing_input::discard);

  auto day = default_component(component_kind::day);
  CHECK_THROWS_AS(apply_modifier(day, "repr", "iso"), std::invalid_argument);
  CHECK_THROWS_AS(apply_modifier(day, "bogus", "x"), std::invalid_argument);
}

TEST_CASE("padded widths", "[component_table]") {
  CHECK(padded_width(default_component(component_kind::ordinal)) == 3);
  CHECK(padded_width(default_component(component_kind::year)) == 4);
  CHECK(padded_width(default_component(component_kind::day)) == 2);
  CHECK(padded_width(default_component(component_kind::offset_hour)) == 2);
  CHECK(padded_width(default_component(component_kind::period)) == 0);

  auto year = default_component(component_kind::year);
  apply_modifier(year, "repr", "last_two");
  CHECK(padded_width(year) == 2);

  auto month = default_component(component_kind::month);
  apply_modifier(month, "repr", "long");
  CHECK(padded_width(month) == 0);
}

TEST_CASE("name tables", "[component_table]") {
  CHECK(month_names(month_repr::long_name)[0] == "January");
  CHECK(month_names(month_repr::short_name)[11] == "Dec");
  CHECK(weekday_names(weekday_repr::long_name)[0] == "Monday");
  CHECK(weekday_names(weekday_repr::short_name)[6] == "Sun");
  CHECK(period_names_upper[1] == "PM");
  CHECK(period_names_lower[0] == "am");
}
