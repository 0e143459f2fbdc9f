#include <tfd/component_table.hpp>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>

namespace tfd {

  namespace {

    // -----------------------------------------------------------------------
    // Accepted values. The first entry of each list is the default.
    // -----------------------------------------------------------------------

    constexpr std::string_view padding_values[] = {"zero", "space", "none"};
    constexpr std::string_view month_repr_values[] = {"numerical", "long",
                                                      "short"};
    constexpr std::string_view weekday_repr_values[] = {"long", "short",
                                                        "sunday", "monday"};
    constexpr std::string_view week_number_repr_values[] = {"iso", "sunday",
                                                            "monday"};
    constexpr std::string_view year_repr_values[] = {"full", "century",
                                                     "last_two"};
    constexpr std::string_view year_range_values[] = {"extended", "standard"};
    constexpr std::string_view year_base_values[] = {"calendar", "iso_week"};
    constexpr std::string_view hour_repr_values[] = {"24", "12"};
    constexpr std::string_view sign_values[] = {"automatic", "mandatory"};
    constexpr std::string_view case_values[] = {"upper", "lower"};
    constexpr std::string_view bool_values[] = {"true", "false"};
    constexpr std::string_view digits_values[] = {"1+", "1", "2", "3", "4",
                                                  "5",  "6", "7", "8", "9"};
    constexpr std::string_view precision_values[] = {
        "second", "millisecond", "microsecond", "nanosecond"};
    constexpr std::string_view trailing_input_values[] = {"prohibit",
                                                          "discard"};

    constexpr modifier_rule padding_rule{"padding", padding_values, "zero"};
    constexpr modifier_rule case_sensitive_rule{"case_sensitive", bool_values,
                                                "true"};
    constexpr modifier_rule sign_rule{"sign", sign_values, "automatic"};

    // -----------------------------------------------------------------------
    // Per-component modifier sets
    // -----------------------------------------------------------------------

    constexpr modifier_rule padding_only[] = {padding_rule};

    constexpr modifier_rule month_rules[] = {
        padding_rule,
        {"repr", month_repr_values, "numerical"},
        case_sensitive_rule,
    };

    constexpr modifier_rule weekday_rules[] = {
        {"repr", weekday_repr_values, "long"},
        {"one_indexed", bool_values, "true"},
        case_sensitive_rule,
    };

    constexpr modifier_rule week_number_rules[] = {
        padding_rule,
        {"repr", week_number_repr_values, "iso"},
    };

    constexpr modifier_rule year_rules[] = {
        padding_rule,
        {"repr", year_repr_values, "full"},
        {"range", year_range_values, "extended"},
        {"base", year_base_values, "calendar"},
        sign_rule,
    };

    constexpr modifier_rule hour_rules[] = {
        padding_rule,
        {"repr", hour_repr_values, "24"},
    };

    constexpr modifier_rule period_rules[] = {
        {"case", case_values, "upper"},
        case_sensitive_rule,
    };

    constexpr modifier_rule subsecond_rules[] = {
        {"digits", digits_values, "1+"},
    };

    constexpr modifier_rule offset_hour_rules[] = {
        padding_rule,
        sign_rule,
    };

    constexpr modifier_rule ignore_rules[] = {
        {"count", {}, {}, true, 1, 65535},
    };

    constexpr modifier_rule unix_timestamp_rules[] = {
        {"precision", precision_values, "second"},
        sign_rule,
    };

    constexpr modifier_rule end_rules[] = {
        {"trailing_input", trailing_input_values, "prohibit"},
    };

    const component_rule rules[] = {
        {"day", component_kind::day, padding_only},
        {"month", component_kind::month, month_rules},
        {"ordinal", component_kind::ordinal, padding_only},
        {"weekday", component_kind::weekday, weekday_rules},
        {"week_number", component_kind::week_number, week_number_rules},
        {"year", component_kind::year, year_rules},
        {"hour", component_kind::hour, hour_rules},
        {"minute", component_kind::minute, padding_only},
        {"period", component_kind::period, period_rules},
        {"second", component_kind::second, padding_only},
        {"subsecond", component_kind::subsecond, subsecond_rules},
        {"offset_hour", component_kind::offset_hour, offset_hour_rules},
        {"offset_minute", component_kind::offset_minute, padding_only},
        {"offset_second", component_kind::offset_second, padding_only},
        {"ignore", component_kind::ignore, ignore_rules},
        {"unix_timestamp", component_kind::unix_timestamp,
         unix_timestamp_rules},
        {"end", component_kind::end, end_rules},
    };

    constexpr std::string_view month_long[] = {
        "January", "February", "March",     "April",   "May",      "June",
        "July",    "August",   "September", "October", "November", "December"};

    constexpr std::string_view month_short[] = {"Jan", "Feb", "Mar", "Apr",
                                                "May", "Jun", "Jul", "Aug",
                                                "Sep", "Oct", "Nov", "Dec"};

    constexpr std::string_view weekday_long[] = {
        "Monday", "Tuesday",  "Wednesday", "Thursday",
        "Friday", "Saturday", "Sunday"};

    constexpr std::string_view weekday_short[] = {"Mon", "Tue", "Wed", "Thu",
                                                  "Fri", "Sat", "Sun"};

    char
    ascii_lower(char c) {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    // Names, keys and values in descriptions ignore ASCII case.
    bool
    iequals(std::string_view a, std::string_view b) {
      return a.size() == b.size() &&
             std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return ascii_lower(x) == ascii_lower(y);
             });
    }

    std::string
    lowercase(std::string_view s) {
      std::string out(s);
      std::transform(out.begin(), out.end(), out.begin(), ascii_lower);
      return out;
    }

    // Position of value in the rule's value list.
    std::size_t
    value_index(std::span<const std::string_view> values,
                std::string_view value) {
      auto it = std::find_if(values.begin(), values.end(),
                             [&](std::string_view v) {
                               return iequals(v, value);
                             });
      if (it == values.end()) {
        throw std::invalid_argument("unknown modifier value: " +
                                    std::string(value));
      }
      return static_cast<std::size_t>(it - values.begin());
    }

    std::uint32_t
    parse_number(std::string_view value) {
      std::uint32_t n = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        throw std::invalid_argument("modifier value is not a number: " +
                                    std::string(value));
      }
      return n;
    }

  } // namespace

  std::span<const component_rule>
  component_rules() {
    return rules;
  }

  const component_rule*
  find_component(std::string_view name) {
    for (const auto& r : rules)
      if (iequals(r.name, name)) return &r;
    return nullptr;
  }

  const component_rule&
  rule_for(component_kind kind) {
    return rules[static_cast<std::size_t>(kind)];
  }

  const modifier_rule*
  find_modifier(const component_rule& rule, std::string_view key) {
    for (const auto& m : rule.modifiers)
      if (iequals(m.key, key)) return &m;
    return nullptr;
  }

  bool
  accepts_value(const modifier_rule& rule, std::string_view value) {
    if (!rule.values.empty()) {
      return std::any_of(rule.values.begin(), rule.values.end(),
                         [&](std::string_view v) { return iequals(v, value); });
    }
    if (value.empty() || value.size() > 10) return false;
    if (!std::all_of(value.begin(), value.end(),
                     [](char c) { return c >= '0' && c <= '9'; }))
      return false;
    auto n = parse_number(value);
    return n >= rule.min && n <= rule.max;
  }

  void
  apply_modifier(component_spec& spec, std::string_view key_text,
                 std::string_view value) {
    auto& m = spec.mods;
    auto key = lowercase(key_text);

    if (key == "padding") {
      m.pad = static_cast<padding>(value_index(padding_values, value));
    } else if (key == "case_sensitive") {
      m.case_sensitive = iequals(value, "true");
    } else if (key == "sign") {
      m.sign = static_cast<sign_mode>(value_index(sign_values, value));
    } else if (key == "one_indexed") {
      m.one_indexed = iequals(value, "true");
    } else if (key == "range") {
      m.range = static_cast<year_range>(value_index(year_range_values, value));
    } else if (key == "base") {
      m.base = static_cast<year_base>(value_index(year_base_values, value));
    } else if (key == "case") {
      m.period_case = static_cast<letter_case>(value_index(case_values, value));
    } else if (key == "digits") {
      m.digits = static_cast<subsecond_digits>(
          value_index(digits_values, value));
    } else if (key == "count") {
      m.count = static_cast<std::uint16_t>(parse_number(value));
    } else if (key == "precision") {
      m.precision = static_cast<timestamp_precision>(
          value_index(precision_values, value));
    } else if (key == "trailing_input") {
      m.trailing = static_cast<trailing_input>(
          value_index(trailing_input_values, value));
    } else if (key == "repr") {
      switch (spec.kind) {
        case component_kind::month:
          m.month =
              static_cast<month_repr>(value_index(month_repr_values, value));
          break;
        case component_kind::weekday:
          m.weekday = static_cast<weekday_repr>(
              value_index(weekday_repr_values, value));
          break;
        case component_kind::week_number:
          m.week_number = static_cast<week_number_repr>(
              value_index(week_number_repr_values, value));
          break;
        case component_kind::year:
          m.year = static_cast<year_repr>(value_index(year_repr_values, value));
          break;
        case component_kind::hour:
          m.hour = static_cast<hour_repr>(value_index(hour_repr_values, value));
          break;
        default:
          throw std::invalid_argument("component has no repr modifier: " +
                                      std::string(to_string(spec.kind)));
      }
    } else {
      throw std::invalid_argument("unknown modifier key: " + key);
    }
  }

  component_spec
  default_component(component_kind kind) {
    component_spec spec;
    spec.kind = kind;
    for (const auto& m : rule_for(kind).modifiers) {
      if (!m.required) apply_modifier(spec, m.key, m.default_value);
    }
    return spec;
  }

  std::size_t
  padded_width(const component_spec& spec) {
    switch (spec.kind) {
      case component_kind::ordinal:
        return 3;
      case component_kind::year:
        return spec.mods.year == year_repr::full ? 4 : 2;
      case component_kind::month:
        return spec.mods.month == month_repr::numerical ? 2 : 0;
      case component_kind::day:
      case component_kind::week_number:
      case component_kind::hour:
      case component_kind::minute:
      case component_kind::second:
      case component_kind::offset_hour:
      case component_kind::offset_minute:
      case component_kind::offset_second:
        return 2;
      default:
        return 0;
    }
  }

  std::span<const std::string_view>
  month_names(month_repr repr) {
    if (repr == month_repr::short_name) return month_short;
    return month_long;
  }

  std::span<const std::string_view>
  weekday_names(weekday_repr repr) {
    if (repr == weekday_repr::short_name) return weekday_short;
    return weekday_long;
  }

  std::string_view
  to_string(component_kind kind) {
    return rule_for(kind).name;
  }

} // namespace tfd
