#include <tfd/embed_writer.hpp>

#include <tfd/component_table.hpp>

#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tfd {

  namespace {

    // -----------------------------------------------------------------------
    // Enumerator spellings in generated code
    // -----------------------------------------------------------------------

    std::string_view
    enumerator(padding v) {
      switch (v) {
        case padding::zero: return "zero";
        case padding::space: return "space";
        case padding::none: return "none";
      }
      return "";
    }

    std::string_view
    enumerator(month_repr v) {
      switch (v) {
        case month_repr::numerical: return "numerical";
        case month_repr::long_name: return "long_name";
        case month_repr::short_name: return "short_name";
      }
      return "";
    }

    std::string_view
    enumerator(weekday_repr v) {
      switch (v) {
        case weekday_repr::long_name: return "long_name";
        case weekday_repr::short_name: return "short_name";
        case weekday_repr::sunday: return "sunday";
        case weekday_repr::monday: return "monday";
      }
      return "";
    }

    std::string_view
    enumerator(week_number_repr v) {
      switch (v) {
        case week_number_repr::iso: return "iso";
        case week_number_repr::sunday: return "sunday";
        case week_number_repr::monday: return "monday";
      }
      return "";
    }

    std::string_view
    enumerator(year_repr v) {
      switch (v) {
        case year_repr::full: return "full";
        case year_repr::century: return "century";
        case year_repr::last_two: return "last_two";
      }
      return "";
    }

    std::string_view
    enumerator(year_range v) {
      switch (v) {
        case year_range::extended: return "extended";
        case year_range::standard: return "standard";
      }
      return "";
    }

    std::string_view
    enumerator(year_base v) {
      switch (v) {
        case year_base::calendar: return "calendar";
        case year_base::iso_week: return "iso_week";
      }
      return "";
    }

    std::string_view
    enumerator(hour_repr v) {
      switch (v) {
        case hour_repr::twenty_four: return "twenty_four";
        case hour_repr::twelve: return "twelve";
      }
      return "";
    }

    std::string_view
    enumerator(sign_mode v) {
      switch (v) {
        case sign_mode::automatic: return "automatic";
        case sign_mode::mandatory: return "mandatory";
      }
      return "";
    }

    std::string_view
    enumerator(letter_case v) {
      switch (v) {
        case letter_case::upper: return "upper";
        case letter_case::lower: return "lower";
      }
      return "";
    }

    std::string_view
    enumerator(timestamp_precision v) {
      switch (v) {
        case timestamp_precision::second: return "second";
        case timestamp_precision::millisecond: return "millisecond";
        case timestamp_precision::microsecond: return "microsecond";
        case timestamp_precision::nanosecond: return "nanosecond";
      }
      return "";
    }

    std::string_view
    enumerator(trailing_input v) {
      switch (v) {
        case trailing_input::prohibit: return "prohibit";
        case trailing_input::discard: return "discard";
      }
      return "";
    }

    // -----------------------------------------------------------------------
    // Expression writers
    // -----------------------------------------------------------------------

    // Unprintable bytes become three-digit octal escapes, which cannot absorb
    // a digit that follows them.
    void
    write_string_literal(std::ostream& os, std::string_view bytes) {
      os << '"';
      for (char c : bytes) {
        auto u = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
          os << '\\' << c;
        } else if (u < 0x20 || u >= 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\%03o", u);
          os << buf;
        } else {
          os << c;
        }
      }
      os << '"';
    }

    class expression_writer {
    public:
      explicit expression_writer(std::ostream& os) : os_(os) {}

      void
      write_items(const std::vector<format_item>& items, int indent) {
        for (const auto& item : items) {
          pad(indent);
          write_item(item, indent);
          os_ << ",\n";
        }
      }

    private:
      std::ostream& os_;

      void
      pad(int indent) {
        for (int i = 0; i < indent; ++i)
          os_ << "  ";
      }

      void
      write_item(const format_item& item, int indent) {
        if (item.holds<literal_item>()) {
          const auto& bytes = item.get<literal_item>().bytes;
          os_ << "tfd::literal_item{";
          if (bytes.find('\0') != std::string::npos) {
            os_ << "std::string(";
            write_string_literal(os_, bytes);
            os_ << ", " << bytes.size() << ")";
          } else {
            write_string_literal(os_, bytes);
          }
          os_ << "}";
        } else if (item.holds<component_spec>()) {
          write_component(item.get<component_spec>());
        } else if (item.holds<optional_item>()) {
          os_ << "tfd::optional_item{";
          write_sequence(item.get<optional_item>().items, indent);
          os_ << "}";
        } else {
          const auto& alternatives = item.get<first_item>().alternatives;
          os_ << "tfd::first_item{std::vector<std::vector<tfd::format_item>>{\n";
          for (const auto& alternative : alternatives) {
            pad(indent + 1);
            write_sequence(alternative, indent + 1);
            os_ << ",\n";
          }
          pad(indent);
          os_ << "}}";
        }
      }

      void
      write_sequence(const std::vector<format_item>& items, int indent) {
        if (items.empty()) {
          os_ << "std::vector<tfd::format_item>{}";
          return;
        }
        os_ << "std::vector<tfd::format_item>{\n";
        write_items(items, indent + 1);
        pad(indent);
        os_ << "}";
      }

      // Designated initializers for the members that differ from a
      // value-initialized modifiers, in declaration order.
      void
      write_component(const component_spec& spec) {
        const modifiers defaults{};
        const auto& m = spec.mods;
        std::vector<std::string> fields;

        auto add = [&](std::string_view member, std::string_view type,
                       std::string_view value) {
          fields.push_back("." + std::string(member) + " = tfd::" +
                           std::string(type) + "::" + std::string(value));
        };

        if (m.pad != defaults.pad) add("pad", "padding", enumerator(m.pad));
        if (m.month != defaults.month)
          add("month", "month_repr", enumerator(m.month));
        if (m.weekday != defaults.weekday)
          add("weekday", "weekday_repr", enumerator(m.weekday));
        if (m.week_number != defaults.week_number)
          add("week_number", "week_number_repr", enumerator(m.week_number));
        if (m.year != defaults.year)
          add("year", "year_repr", enumerator(m.year));
        if (m.range != defaults.range)
          add("range", "year_range", enumerator(m.range));
        if (m.base != defaults.base)
          add("base", "year_base", enumerator(m.base));
        if (m.hour != defaults.hour)
          add("hour", "hour_repr", enumerator(m.hour));
        if (m.sign != defaults.sign)
          add("sign", "sign_mode", enumerator(m.sign));
        if (m.period_case != defaults.period_case)
          add("period_case", "letter_case", enumerator(m.period_case));
        if (m.case_sensitive != defaults.case_sensitive)
          fields.push_back(std::string(".case_sensitive = ") +
                           (m.case_sensitive ? "true" : "false"));
        if (m.one_indexed != defaults.one_indexed)
          fields.push_back(std::string(".one_indexed = ") +
                           (m.one_indexed ? "true" : "false"));
        if (m.digits != defaults.digits)
          fields.push_back(".digits = " + std::to_string(m.digits));
        if (m.count != defaults.count)
          fields.push_back(".count = " + std::to_string(m.count));
        if (m.precision != defaults.precision)
          add("precision", "timestamp_precision", enumerator(m.precision));
        if (m.trailing != defaults.trailing)
          add("trailing", "trailing_input", enumerator(m.trailing));

        os_ << "tfd::component_spec{tfd::component_kind::"
            << to_string(spec.kind) << ", tfd::modifiers{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
          if (i > 0) os_ << ", ";
          os_ << fields[i];
        }
        os_ << "}}";
      }
    };

    bool
    is_identifier_start(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool
    is_identifier_char(char c) {
      return is_identifier_start(c) || (c >= '0' && c <= '9');
    }

    bool
    is_blank(char c) {
      return c == ' ' || c == '\t' || c == '\r';
    }

  } // namespace

  bool
  is_identifier(std::string_view s, bool qualified) {
    if (qualified) {
      std::size_t start = 0;
      while (true) {
        auto sep = s.find("::", start);
        if (!is_identifier(s.substr(start, sep - start), false)) return false;
        if (sep == std::string_view::npos) return true;
        start = sep + 2;
      }
    }
    if (s.empty() || !is_identifier_start(s.front())) return false;
    for (char c : s)
      if (!is_identifier_char(c)) return false;
    return true;
  }

  std::vector<description_entry>
  read_descriptions(std::string_view text) {
    std::vector<description_entry> entries;
    std::set<std::string, std::less<>> seen;

    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
      auto eol = text.find('\n', pos);
      auto line = text.substr(pos, eol == std::string_view::npos
                                       ? std::string_view::npos
                                       : eol - pos);
      pos = eol == std::string_view::npos ? text.size() : eol + 1;
      ++line_no;

      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

      std::size_t i = 0;
      while (i < line.size() && is_blank(line[i]))
        ++i;
      if (i == line.size() || line[i] == '#') continue;

      auto name_begin = i;
      while (i < line.size() && !is_blank(line[i]))
        ++i;
      auto name = line.substr(name_begin, i - name_begin);
      if (!is_identifier(name)) {
        throw std::invalid_argument("line " + std::to_string(line_no) +
                                    ": invalid identifier '" +
                                    std::string(name) + "'");
      }
      if (seen.contains(name)) {
        throw std::invalid_argument("line " + std::to_string(line_no) +
                                    ": duplicate identifier '" +
                                    std::string(name) + "'");
      }

      while (i < line.size() && is_blank(line[i]))
        ++i;
      if (i == line.size()) {
        throw std::invalid_argument("line " + std::to_string(line_no) +
                                    ": missing description for '" +
                                    std::string(name) + "'");
      }

      seen.emplace(name);
      entries.push_back(
          {std::string(name), std::string(line.substr(i)), line_no, i});
    }

    return entries;
  }

  std::string
  embed_writer::write(
      const std::vector<embedded_description>& descriptions) const {
    std::ostringstream os;

    os << "#pragma once\n"
       << "\n"
       << "// Generated by tfd-embed. Do not edit.\n"
       << "\n"
       << "#include <tfd/format_item.hpp>\n"
       << "\n"
       << "#include <string>\n"
       << "#include <vector>\n"
       << "\n"
       << "namespace " << namespace_ << " {\n";

    expression_writer expr(os);
    for (const auto& d : descriptions) {
      os << "\n"
         << "  inline const tfd::format_description&\n"
         << "  " << d.name << "() {\n"
         << "    static const tfd::format_description description{\n";
      expr.write_items(d.description, 3);
      os << "    };\n"
         << "    return description;\n"
         << "  }\n";
    }

    os << "\n} // namespace " << namespace_ << "\n";
    return os.str();
  }

} // namespace tfd
