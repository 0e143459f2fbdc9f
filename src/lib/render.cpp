#include <tfd/render.hpp>

#include <tfd/component_table.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace tfd {

  namespace {

    std::size_t
    digit_count(uint64_t value) {
      std::size_t n = 1;
      while (value >= 10) {
        value /= 10;
        ++n;
      }
      return n;
    }

    constexpr uint64_t max_year = 999'999;

    uint64_t
    magnitude(int64_t value) {
      return value < 0 ? uint64_t{0} - static_cast<uint64_t>(value)
                       : static_cast<uint64_t>(value);
    }

    void
    write_number(std::string& out, uint64_t value, padding pad,
                 std::size_t width) {
      auto digits = digit_count(value);
      if (pad != padding::none && digits < width)
        out.append(width - digits, pad == padding::zero ? '0' : ' ');
      out += std::to_string(value);
    }

    class renderer {
    public:
      explicit renderer(const value_provider& values) : values_(values) {}

      void
      render_items(const std::vector<format_item>& items, std::string& out) {
        for (const auto& item : items)
          render_item(item, out);
      }

    private:
      const value_provider& values_;

      void
      render_item(const format_item& item, std::string& out) {
        if (item.holds<literal_item>()) {
          out += item.get<literal_item>().bytes;
        } else if (item.holds<component_spec>()) {
          render_component(item.get<component_spec>(), out);
        } else if (item.holds<optional_item>()) {
          render_optional(item.get<optional_item>(), out);
        } else {
          render_first(item.get<first_item>(), out);
        }
      }

      // Rendered into scratch space so a failing group leaves no partial
      // output behind.
      void
      render_optional(const optional_item& group, std::string& out) {
        std::string scratch;
        try {
          render_items(group.items, scratch);
        } catch (const format_error&) {
          return;
        }
        out += scratch;
      }

      void
      render_first(const first_item& group, std::string& out) {
        std::optional<format_error> last;
        for (const auto& alternative : group.alternatives) {
          std::string scratch;
          try {
            render_items(alternative, scratch);
          } catch (const format_error& e) {
            last = e;
            continue;
          }
          out += scratch;
          return;
        }
        if (last) throw *last;
      }

      [[noreturn]] static void
      unsupported(component_kind kind) {
        throw format_error(format_error_kind::unsupported_component, kind);
      }

      [[noreturn]] static void
      invalid(component_kind kind) {
        throw format_error(format_error_kind::invalid_component_value, kind);
      }

      date_fields
      require_date(component_kind kind) const {
        auto d = values_.date();
        if (!d) unsupported(kind);
        return *d;
      }

      time_fields
      require_time(component_kind kind) const {
        auto t = values_.time();
        if (!t) unsupported(kind);
        if (t->hour > 23 || t->minute > 59 || t->second > 59 ||
            t->nanosecond > 999'999'999)
          invalid(kind);
        return *t;
      }

      offset_fields
      require_offset(component_kind kind) const {
        auto o = values_.offset();
        if (!o) unsupported(kind);
        return *o;
      }

      void
      render_component(const component_spec& spec, std::string& out) const {
        const auto& m = spec.mods;
        auto width = padded_width(spec);

        switch (spec.kind) {
          case component_kind::day: {
            auto d = require_date(spec.kind);
            if (d.day < 1 || d.day > 31) invalid(spec.kind);
            write_number(out, d.day, m.pad, width);
            break;
          }
          case component_kind::month: {
            auto d = require_date(spec.kind);
            if (d.month < 1 || d.month > 12) invalid(spec.kind);
            if (m.month == month_repr::numerical)
              write_number(out, d.month, m.pad, width);
            else
              out += month_names(m.month)[d.month - 1];
            break;
          }
          case component_kind::ordinal: {
            auto d = require_date(spec.kind);
            if (d.ordinal < 1 || d.ordinal > 366) invalid(spec.kind);
            write_number(out, d.ordinal, m.pad, width);
            break;
          }
          case component_kind::weekday:
            render_weekday(spec, require_date(spec.kind).weekday, out);
            break;
          case component_kind::week_number: {
            auto d = require_date(spec.kind);
            uint8_t week = d.iso_week;
            if (m.week_number == week_number_repr::sunday)
              week = d.sunday_week;
            else if (m.week_number == week_number_repr::monday)
              week = d.monday_week;
            auto first = m.week_number == week_number_repr::iso ? 1 : 0;
            if (week < first || week > 53) invalid(spec.kind);
            write_number(out, week, m.pad, width);
            break;
          }
          case component_kind::year:
            render_year(spec, require_date(spec.kind), out);
            break;
          case component_kind::hour: {
            auto t = require_time(spec.kind);
            uint8_t hour = t.hour;
            if (m.hour == hour_repr::twelve) {
              hour = static_cast<uint8_t>(hour % 12);
              if (hour == 0) hour = 12;
            }
            write_number(out, hour, m.pad, width);
            break;
          }
          case component_kind::minute:
            write_number(out, require_time(spec.kind).minute, m.pad, width);
            break;
          case component_kind::second:
            write_number(out, require_time(spec.kind).second, m.pad, width);
            break;
          case component_kind::period: {
            auto t = require_time(spec.kind);
            std::size_t index = t.hour < 12 ? 0 : 1;
            out += m.period_case == letter_case::upper
                       ? period_names_upper[index]
                       : period_names_lower[index];
            break;
          }
          case component_kind::subsecond:
            render_subsecond(spec, require_time(spec.kind).nanosecond, out);
            break;
          case component_kind::offset_hour: {
            auto o = require_offset(spec.kind);
            auto hours = magnitude(o.hours);
            if (hours > 25) invalid(spec.kind);
            if (o.is_negative())
              out += '-';
            else if (m.sign == sign_mode::mandatory)
              out += '+';
            write_number(out, hours, m.pad, width);
            break;
          }
          case component_kind::offset_minute: {
            auto minutes = magnitude(require_offset(spec.kind).minutes);
            if (minutes > 59) invalid(spec.kind);
            write_number(out, minutes, m.pad, width);
            break;
          }
          case component_kind::offset_second: {
            auto seconds = magnitude(require_offset(spec.kind).seconds);
            if (seconds > 59) invalid(spec.kind);
            write_number(out, seconds, m.pad, width);
            break;
          }
          case component_kind::unix_timestamp:
            render_timestamp(spec, out);
            break;
          case component_kind::ignore:
            unsupported(spec.kind);
          case component_kind::end:
            break;
        }
      }

      static void
      render_weekday(const component_spec& spec, day_of_week weekday,
                     std::string& out) {
        const auto& m = spec.mods;
        auto from_monday = static_cast<unsigned>(weekday);
        if (from_monday > 6) invalid(spec.kind);

        switch (m.weekday) {
          case weekday_repr::long_name:
          case weekday_repr::short_name:
            out += weekday_names(m.weekday)[from_monday];
            break;
          case weekday_repr::sunday:
            out += std::to_string((from_monday + 1) % 7 + (m.one_indexed ? 1 : 0));
            break;
          case weekday_repr::monday:
            out += std::to_string(from_monday + (m.one_indexed ? 1 : 0));
            break;
        }
      }

      // Years are limited to six digits, or four under range:standard.
      // Anything longer would not parse back to the same value.
      static void
      render_year(const component_spec& spec, const date_fields& d,
                  std::string& out) {
        const auto& m = spec.mods;
        int32_t year = m.base == year_base::iso_week ? d.iso_year : d.year;
        auto abs_year = magnitude(year);
        auto width = padded_width(spec);

        if (abs_year > max_year) invalid(spec.kind);

        if (m.year == year_repr::last_two) {
          write_number(out, abs_year % 100, m.pad, width);
          return;
        }

        if (m.range == year_range::standard && abs_year > 9999)
          invalid(spec.kind);

        if (year < 0)
          out += '-';
        else if (m.sign == sign_mode::mandatory || year > 9999)
          out += '+';

        if (m.year == year_repr::century)
          write_number(out, abs_year / 100, m.pad, width);
        else
          write_number(out, abs_year, m.pad, width);
      }

      static void
      render_subsecond(const component_spec& spec, uint32_t nanosecond,
                       std::string& out) {
        auto digits = std::to_string(nanosecond);
        digits.insert(0, 9 - digits.size(), '0');

        if (spec.mods.digits == one_or_more_digits) {
          auto last = digits.find_last_not_of('0');
          digits.resize(last == std::string::npos ? 1 : last + 1);
        } else {
          digits.resize(spec.mods.digits);
        }
        out += digits;
      }

      void
      render_timestamp(const component_spec& spec, std::string& out) const {
        auto ts = values_.timestamp();
        if (!ts) unsupported(spec.kind);
        if (ts->nanosecond > 999'999'999) invalid(spec.kind);

        int64_t scale = 1;
        int64_t fraction = 0;
        switch (spec.mods.precision) {
          case timestamp_precision::second:
            break;
          case timestamp_precision::millisecond:
            scale = 1'000;
            fraction = ts->nanosecond / 1'000'000;
            break;
          case timestamp_precision::microsecond:
            scale = 1'000'000;
            fraction = ts->nanosecond / 1'000;
            break;
          case timestamp_precision::nanosecond:
            scale = 1'000'000'000;
            fraction = ts->nanosecond;
            break;
        }

        constexpr auto max = std::numeric_limits<int64_t>::max();
        if (ts->seconds > (max - fraction) / scale ||
            ts->seconds < -(max / scale))
          invalid(spec.kind);
        int64_t value = ts->seconds * scale + fraction;

        if (value < 0)
          out += '-';
        else if (spec.mods.sign == sign_mode::mandatory)
          out += '+';
        out += std::to_string(magnitude(value));
      }
    };

  } // namespace

  std::size_t
  render(const format_description& description, const value_provider& values,
         std::string& out) {
    std::string rendered;
    renderer r(values);
    r.render_items(description, rendered);
    out += rendered;
    return rendered.size();
  }

  std::string
  format(const format_description& description, const value_provider& values) {
    std::string out;
    render(description, values, out);
    return out;
  }

} // namespace tfd
