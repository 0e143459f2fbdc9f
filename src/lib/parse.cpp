#include <tfd/parse.hpp>

#include <tfd/component_table.hpp>
#include <tfd/cursor.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>

namespace tfd {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    ascii_lower(char c) {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    bool
    starts_with(std::string_view input, std::string_view prefix,
                bool case_sensitive) {
      if (input.size() < prefix.size()) return false;
      if (case_sensitive) return input.starts_with(prefix);
      for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (ascii_lower(input[i]) != ascii_lower(prefix[i])) return false;
      }
      return true;
    }

    // Digits are checked by the caller; at most 19 of them are passed in.
    uint64_t
    to_number(std::string_view digits) {
      uint64_t value = 0;
      for (char c : digits)
        value = value * 10 + static_cast<uint64_t>(c - '0');
      return value;
    }

    class matcher {
    public:
      explicit matcher(std::string_view input) : cur_(input) {}

      void
      match_items(const std::vector<format_item>& items) {
        for (const auto& item : items)
          match_item(item);
      }

      const parsed&
      fields() const {
        return fields_;
      }

      const cursor&
      position() const {
        return cur_;
      }

    private:
      cursor cur_;
      parsed fields_;

      void
      match_item(const format_item& item) {
        if (item.holds<literal_item>()) {
          auto start = cur_.offset();
          if (!cur_.consume(std::string_view(item.get<literal_item>().bytes))) {
            throw parse_error(parse_error_kind::invalid_literal, std::nullopt,
                              start);
          }
        } else if (item.holds<component_spec>()) {
          match_component(item.get<component_spec>());
        } else if (item.holds<optional_item>()) {
          match_optional(item.get<optional_item>());
        } else {
          match_first(item.get<first_item>());
        }
      }

      // On failure both the position and the fields go back to where they
      // were before the group.
      void
      match_optional(const optional_item& group) {
        auto saved_cursor = cur_;
        auto saved_fields = fields_;
        try {
          match_items(group.items);
        } catch (const parse_error&) {
          cur_ = saved_cursor;
          fields_ = saved_fields;
        }
      }

      void
      match_first(const first_item& group) {
        auto saved_cursor = cur_;
        auto saved_fields = fields_;
        std::optional<parse_error> last;
        for (const auto& alternative : group.alternatives) {
          try {
            match_items(alternative);
            return;
          } catch (const parse_error& e) {
            cur_ = saved_cursor;
            fields_ = saved_fields;
            last = e;
          }
        }
        if (last) throw *last;
      }

      // -----------------------------------------------------------------------
      // Primitive matchers. Each either consumes and returns a value or
      // leaves the cursor untouched and returns nullopt.
      // -----------------------------------------------------------------------

      // A number of width digits under the given padding; max_digits allows
      // a longer run where the representation permits one.
      std::optional<uint64_t>
      padded_number(std::size_t width, padding pad, std::size_t max_digits) {
        cursor ahead = cur_;
        std::string_view run;
        switch (pad) {
          case padding::none:
            run = ahead.consume_while(is_digit, max_digits);
            if (run.empty()) return std::nullopt;
            break;
          case padding::zero:
            run = ahead.consume_while(is_digit, max_digits);
            if (run.size() < width) return std::nullopt;
            break;
          case padding::space: {
            auto spaces =
                ahead.consume_while([](char c) { return c == ' '; }, width - 1)
                    .size();
            run = ahead.consume_while(is_digit, max_digits - spaces);
            if (run.empty() || run.size() < width - spaces)
              return std::nullopt;
            break;
          }
        }
        cur_ = ahead;
        return to_number(run);
      }

      std::optional<uint64_t>
      padded_number(const component_spec& spec) {
        auto width = padded_width(spec);
        return padded_number(width, spec.mods.pad, width);
      }

      std::optional<char>
      sign() {
        auto c = cur_.peek();
        if (c == '+' || c == '-') {
          cur_.advance();
          return c;
        }
        return std::nullopt;
      }

      std::optional<std::size_t>
      name(std::span<const std::string_view> names, bool case_sensitive) {
        for (std::size_t i = 0; i < names.size(); ++i) {
          if (starts_with(cur_.remaining(), names[i], case_sensitive)) {
            cur_.advance(names[i].size());
            return i;
          }
        }
        return std::nullopt;
      }

      // -----------------------------------------------------------------------
      // Components
      // -----------------------------------------------------------------------

      [[noreturn]] static void
      invalid(component_kind kind, std::size_t offset) {
        throw parse_error(parse_error_kind::invalid_component_value, kind,
                          offset);
      }

      static void
      store(bool accepted, component_kind kind, std::size_t offset) {
        if (!accepted) {
          throw parse_error(parse_error_kind::inconsistent_parsed_field, kind,
                            offset);
        }
      }

      void
      match_component(const component_spec& spec) {
        // Restored on failure so a component never consumes partially.
        auto saved = cur_;
        try {
          decode(spec);
        } catch (const parse_error&) {
          cur_ = saved;
          throw;
        }
      }

      // Consume a bounded number and check it lies in [min, max].
      uint64_t
      ranged(const component_spec& spec, uint64_t min, uint64_t max,
             std::size_t start) {
        auto v = padded_number(spec);
        if (!v || *v < min || *v > max) invalid(spec.kind, start);
        return *v;
      }

      void
      decode(const component_spec& spec) {
        const auto& m = spec.mods;
        auto kind = spec.kind;
        auto start = cur_.offset();

        switch (kind) {
          case component_kind::day:
            store(fields_.set_day(static_cast<uint8_t>(ranged(spec, 1, 31, start))),
                  kind, start);
            break;
          case component_kind::month:
            if (m.month == month_repr::numerical) {
              store(fields_.set_month(
                        static_cast<uint8_t>(ranged(spec, 1, 12, start))),
                    kind, start);
            } else {
              auto index = name(month_names(m.month), m.case_sensitive);
              if (!index) invalid(kind, start);
              store(fields_.set_month(static_cast<uint8_t>(*index + 1)), kind,
                    start);
            }
            break;
          case component_kind::ordinal:
            store(fields_.set_ordinal(
                      static_cast<uint16_t>(ranged(spec, 1, 366, start))),
                  kind, start);
            break;
          case component_kind::weekday:
            store(fields_.set_weekday(weekday(spec, start)), kind, start);
            break;
          case component_kind::week_number:
            decode_week_number(spec, start);
            break;
          case component_kind::year:
            decode_year(spec, start);
            break;
          case component_kind::hour:
            if (m.hour == hour_repr::twelve) {
              store(fields_.set_hour_12(
                        static_cast<uint8_t>(ranged(spec, 1, 12, start))),
                    kind, start);
            } else {
              store(fields_.set_hour_24(
                        static_cast<uint8_t>(ranged(spec, 0, 23, start))),
                    kind, start);
            }
            break;
          case component_kind::minute:
            store(fields_.set_minute(
                      static_cast<uint8_t>(ranged(spec, 0, 59, start))),
                  kind, start);
            break;
          case component_kind::second:
            store(fields_.set_second(
                      static_cast<uint8_t>(ranged(spec, 0, 59, start))),
                  kind, start);
            break;
          case component_kind::period: {
            auto index =
                name(m.period_case == letter_case::upper ? period_names_upper
                                                         : period_names_lower,
                     m.case_sensitive);
            if (!index) invalid(kind, start);
            store(fields_.set_hour_12_is_pm(*index == 1), kind, start);
            break;
          }
          case component_kind::subsecond:
            decode_subsecond(spec, start);
            break;
          case component_kind::offset_hour: {
            auto s = sign();
            if (!s && m.sign == sign_mode::mandatory) invalid(kind, start);
            auto hours = ranged(spec, 0, 25, start);
            bool negative = s == '-';
            auto value = static_cast<int8_t>(negative ? -static_cast<int>(hours)
                                                      : static_cast<int>(hours));
            store(fields_.set_offset_hour(value), kind, start);
            store(fields_.set_offset_is_negative(negative), kind, start);
            break;
          }
          case component_kind::offset_minute:
            store(fields_.set_offset_minute(
                      static_cast<uint8_t>(ranged(spec, 0, 59, start))),
                  kind, start);
            break;
          case component_kind::offset_second:
            store(fields_.set_offset_second(
                      static_cast<uint8_t>(ranged(spec, 0, 59, start))),
                  kind, start);
            break;
          case component_kind::ignore:
            if (cur_.remaining().size() < m.count) invalid(kind, start);
            cur_.advance(m.count);
            break;
          case component_kind::unix_timestamp:
            decode_timestamp(spec, start);
            break;
          case component_kind::end:
            if (m.trailing == trailing_input::discard) {
              cur_.advance(cur_.remaining().size());
            } else if (!cur_.at_end()) {
              throw parse_error(
                  parse_error_kind::unexpected_trailing_characters, kind,
                  start);
            }
            break;
        }
      }

      day_of_week
      weekday(const component_spec& spec, std::size_t start) {
        const auto& m = spec.mods;
        if (m.weekday == weekday_repr::long_name ||
            m.weekday == weekday_repr::short_name) {
          auto index = name(weekday_names(m.weekday), m.case_sensitive);
          if (!index) invalid(spec.kind, start);
          return static_cast<day_of_week>(*index);
        }

        auto c = cur_.peek();
        if (!c || !is_digit(*c)) invalid(spec.kind, start);
        int n = *c - '0' - (m.one_indexed ? 1 : 0);
        if (n < 0 || n > 6) invalid(spec.kind, start);
        cur_.advance();
        // Numbered from Sunday: Sunday is 0, Monday 1.
        if (m.weekday == weekday_repr::sunday) n = (n + 6) % 7;
        return static_cast<day_of_week>(n);
      }

      void
      decode_week_number(const component_spec& spec, std::size_t start) {
        auto kind = spec.kind;
        switch (spec.mods.week_number) {
          case week_number_repr::iso:
            store(fields_.set_iso_week_number(
                      static_cast<uint8_t>(ranged(spec, 1, 53, start))),
                  kind, start);
            break;
          case week_number_repr::sunday:
            store(fields_.set_sunday_week_number(
                      static_cast<uint8_t>(ranged(spec, 0, 53, start))),
                  kind, start);
            break;
          case week_number_repr::monday:
            store(fields_.set_monday_week_number(
                      static_cast<uint8_t>(ranged(spec, 0, 53, start))),
                  kind, start);
            break;
        }
      }

      // Without a sign a full year is exactly four digits and a century one
      // or two. A sign allows up to six (full) or four (century) digits
      // under range:extended, which is how years above 9999 are written.
      void
      decode_year(const component_spec& spec, std::size_t start) {
        const auto& m = spec.mods;
        auto kind = spec.kind;
        bool iso = m.base == year_base::iso_week;
        auto width = padded_width(spec);

        if (m.year == year_repr::last_two) {
          auto v = padded_number(width, m.pad, width);
          if (!v) invalid(kind, start);
          auto value = static_cast<uint8_t>(*v);
          store(iso ? fields_.set_iso_year_last_two(value)
                    : fields_.set_year_last_two(value),
                kind, start);
          return;
        }

        auto s = sign();
        if (!s && m.sign == sign_mode::mandatory) invalid(kind, start);
        std::size_t max_digits = width;
        if (s && m.range == year_range::extended)
          max_digits = m.year == year_repr::full ? 6 : 4;
        auto v = padded_number(width, m.pad, max_digits);
        if (!v) invalid(kind, start);
        auto value = static_cast<int32_t>(*v);
        bool negative = s == '-';
        if (negative) value = -value;

        if (m.year == year_repr::century) {
          // The sign is kept apart so that -00 (years -1 to -99) survives.
          store(iso ? fields_.set_iso_year_century(value)
                    : fields_.set_year_century(value),
                kind, start);
          store(iso ? fields_.set_iso_year_century_is_negative(negative)
                    : fields_.set_year_century_is_negative(negative),
                kind, start);
        } else {
          store(iso ? fields_.set_iso_year(value) : fields_.set_year(value),
                kind, start);
        }
      }

      void
      decode_subsecond(const component_spec& spec, std::size_t start) {
        std::string_view run;
        if (spec.mods.digits == one_or_more_digits) {
          run = cur_.consume_while(is_digit);
          if (run.empty()) invalid(spec.kind, start);
          // Digits past nanosecond precision are matched but dropped.
          if (run.size() > 9) run = run.substr(0, 9);
        } else {
          cursor ahead = cur_;
          run = ahead.consume_while(is_digit, spec.mods.digits);
          if (run.size() != spec.mods.digits) invalid(spec.kind, start);
          cur_ = ahead;
        }

        auto value = to_number(run);
        for (auto n = run.size(); n < 9; ++n)
          value *= 10;
        store(fields_.set_subsecond(static_cast<uint32_t>(value)), spec.kind,
              start);
      }

      void
      decode_timestamp(const component_spec& spec, std::size_t start) {
        const auto& m = spec.mods;
        auto s = sign();
        if (!s && m.sign == sign_mode::mandatory) invalid(spec.kind, start);

        auto run = cur_.consume_while(is_digit);
        if (run.empty() || run.size() > 19) invalid(spec.kind, start);

        uint64_t to_nanos = 1'000'000'000;
        switch (m.precision) {
          case timestamp_precision::second:
            break;
          case timestamp_precision::millisecond:
            to_nanos = 1'000'000;
            break;
          case timestamp_precision::microsecond:
            to_nanos = 1'000;
            break;
          case timestamp_precision::nanosecond:
            to_nanos = 1;
            break;
        }

        constexpr auto max = static_cast<uint64_t>(
            std::numeric_limits<int64_t>::max());
        auto value = to_number(run);
        if (value > max / to_nanos) invalid(spec.kind, start);
        auto nanos = static_cast<int64_t>(value * to_nanos);
        if (s == '-') nanos = -nanos;
        store(fields_.set_unix_timestamp_nanos(nanos), spec.kind, start);
      }
    };

  } // namespace

  parse_result
  parse(const format_description& description, std::string_view input) {
    matcher m(input);
    m.match_items(description);
    return parse_result{m.fields(), m.position().offset()};
  }

  parsed
  parse_exact(const format_description& description, std::string_view input) {
    auto result = parse(description, input);
    if (result.consumed != input.size()) {
      throw parse_error(parse_error_kind::unexpected_trailing_characters,
                        std::nullopt, result.consumed);
    }
    return result.fields;
  }

} // namespace tfd
