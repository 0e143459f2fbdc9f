#include <tfd/strftime.hpp>

#include <tfd/component_table.hpp>
#include <tfd/cursor.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tfd {

  namespace {

    // Grammar:
    //   description := (literal | conversion)*
    //   conversion  := '%' flag? letter
    //   flag        := '_' | '-' | '0'

    class strftime_grammar {
    public:
      explicit strftime_grammar(std::string_view source) : cur_(source) {}

      format_description
      parse() {
        while (auto c = cur_.peek()) {
          if (*c == '%') {
            parse_conversion();
          } else {
            literal_ += *c;
            cur_.advance();
          }
        }
        flush();
        return std::move(items_);
      }

    private:
      cursor cur_;
      format_description items_;
      std::string literal_;
      // Set while a conversion with an explicit flag is being expanded.
      std::optional<padding> flag_;

      void
      flush() {
        if (literal_.empty()) return;
        items_.emplace_back(literal_item{std::move(literal_)});
        literal_.clear();
      }

      void
      text(std::string_view bytes) {
        literal_ += bytes;
      }

      // A component whose padding follows the conversion's flag, falling
      // back to pad.
      void
      padded(component_kind kind, padding pad = padding::zero) {
        auto spec = default_component(kind);
        spec.mods.pad = flag_.value_or(pad);
        push(spec);
      }

      // Parts of a composite conversion ignore the flag.
      void
      fixed(component_kind kind, padding pad = padding::zero) {
        auto spec = default_component(kind);
        spec.mods.pad = pad;
        push(spec);
      }

      void
      push(const component_spec& spec) {
        flush();
        items_.emplace_back(spec);
      }

      component_spec
      with(component_kind kind, std::string_view key, std::string_view value) {
        auto spec = default_component(kind);
        apply_modifier(spec, key, value);
        return spec;
      }

      void
      parse_conversion() {
        auto begin = cur_.offset();
        cur_.advance();

        auto c = cur_.peek();
        if (c == '_' || c == '-' || c == '0') {
          flag_ = *c == '_' ? padding::space
                            : (*c == '-' ? padding::none : padding::zero);
          cur_.advance();
          c = cur_.peek();
        }
        if (!c) {
          throw invalid_format_description(
              description_error::unexpected_token,
              byte_span{begin, cur_.offset()},
              "expected a conversion after '%'");
        }
        cur_.advance();
        expand(*c, byte_span{begin, cur_.offset()});
        flag_.reset();
      }

      void
      hour_minute_second() {
        fixed(component_kind::hour);
        text(":");
        fixed(component_kind::minute);
        text(":");
        fixed(component_kind::second);
      }

      void
      month_day_year() {
        fixed(component_kind::month);
        text("/");
        fixed(component_kind::day);
        text("/");
        push(with(component_kind::year, "repr", "last_two"));
      }

      void
      expand(char conversion, byte_span span) {
        switch (conversion) {
          case '%': text("%"); break;
          case 'n': text("\n"); break;
          case 't': text("\t"); break;
          case 'a': push(with(component_kind::weekday, "repr", "short")); break;
          case 'A': push(default_component(component_kind::weekday)); break;
          case 'b':
          case 'h': push(with(component_kind::month, "repr", "short")); break;
          case 'B': push(with(component_kind::month, "repr", "long")); break;
          case 'C': {
            auto spec = with(component_kind::year, "repr", "century");
            spec.mods.pad = flag_.value_or(padding::zero);
            push(spec);
            break;
          }
          case 'd': padded(component_kind::day); break;
          case 'e': padded(component_kind::day, padding::space); break;
          case 'g': {
            auto spec = with(component_kind::year, "repr", "last_two");
            apply_modifier(spec, "base", "iso_week");
            spec.mods.pad = flag_.value_or(padding::zero);
            push(spec);
            break;
          }
          case 'G':
            push(with(component_kind::year, "base", "iso_week"));
            break;
          case 'H': padded(component_kind::hour); break;
          case 'k': padded(component_kind::hour, padding::space); break;
          case 'I':
          case 'l': {
            auto spec = with(component_kind::hour, "repr", "12");
            spec.mods.pad = flag_.value_or(conversion == 'I' ? padding::zero
                                                             : padding::space);
            push(spec);
            break;
          }
          case 'j': padded(component_kind::ordinal); break;
          case 'm': padded(component_kind::month); break;
          case 'M': padded(component_kind::minute); break;
          case 'p': push(default_component(component_kind::period)); break;
          case 'P': push(with(component_kind::period, "case", "lower")); break;
          case 's': push(default_component(component_kind::unix_timestamp)); break;
          case 'S': padded(component_kind::second); break;
          case 'u': push(with(component_kind::weekday, "repr", "monday")); break;
          case 'w': {
            auto spec = with(component_kind::weekday, "repr", "sunday");
            spec.mods.one_indexed = false;
            push(spec);
            break;
          }
          case 'U':
          case 'V':
          case 'W': {
            auto repr = conversion == 'U'   ? "sunday"
                        : conversion == 'W' ? "monday"
                                            : "iso";
            auto spec = with(component_kind::week_number, "repr", repr);
            spec.mods.pad = flag_.value_or(padding::zero);
            push(spec);
            break;
          }
          case 'y': {
            auto spec = with(component_kind::year, "repr", "last_two");
            spec.mods.pad = flag_.value_or(padding::zero);
            push(spec);
            break;
          }
          case 'Y': push(default_component(component_kind::year)); break;
          case 'z':
            push(with(component_kind::offset_hour, "sign", "mandatory"));
            fixed(component_kind::offset_minute);
            break;
          case 'c':
            push(with(component_kind::weekday, "repr", "short"));
            text(" ");
            push(with(component_kind::month, "repr", "short"));
            text(" ");
            fixed(component_kind::day, padding::space);
            text(" ");
            hour_minute_second();
            text(" ");
            push(default_component(component_kind::year));
            break;
          case 'D':
          case 'x':
            month_day_year();
            break;
          case 'F':
            push(default_component(component_kind::year));
            text("-");
            fixed(component_kind::month);
            text("-");
            fixed(component_kind::day);
            break;
          case 'r':
            push(with(component_kind::hour, "repr", "12"));
            text(":");
            fixed(component_kind::minute);
            text(":");
            fixed(component_kind::second);
            text(" ");
            push(default_component(component_kind::period));
            break;
          case 'R':
            fixed(component_kind::hour);
            text(":");
            fixed(component_kind::minute);
            break;
          case 'T':
          case 'X':
            hour_minute_second();
            break;
          case 'O':
          case 'Z':
            throw invalid_format_description(
                description_error::not_supported, span,
                std::string("'%") + conversion + "'");
          default:
            throw invalid_format_description(
                description_error::invalid_component, span,
                std::string("'%") + conversion + "'");
        }
      }
    };

  } // namespace

  format_description
  compile_strftime(std::string_view source) {
    strftime_grammar g(source);
    return g.parse();
  }

} // namespace tfd
