#include <tfd/description_parser.hpp>

#include <tfd/component_table.hpp>
#include <tfd/cursor.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace tfd {

  namespace {

    // Grammar (version 2 additions marked *):
    //   description := [directive] sequence
    //   directive   := 'version' ws? '=' ws? token (',' ws? | EOF)
    //   sequence    := (literal | '[[' | escape* | bracket)*
    //   escape      := '\' ('\' | '[' | ']')
    //   bracket     := '[' ws? name modifier* ws? ']'
    //                | '[' 'optional' ws nested ws? ']'       *
    //                | '[' 'first' ws nested (ws? nested)* ws? ']' *
    //   nested      := '[' sequence ']'
    //   modifier    := ws key ':' value

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    bool
    is_name_char(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
             (c >= '0' && c <= '9') || c == '_';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    class grammar {
    public:
      grammar(std::string_view source, description_version version)
          : cur_(source), version_(version) {}

      format_description
      parse() {
        read_version_directive();
        return parse_sequence(false, 0);
      }

    private:
      cursor cur_;
      description_version version_;
      std::size_t depth_ = 0;

      [[noreturn]] void
      fail(description_error kind, std::size_t begin, std::size_t end,
           const std::string& detail = {}) const {
        throw invalid_format_description(kind, byte_span{begin, end}, detail);
      }

      [[noreturn]] void
      fail_unclosed(std::size_t open) const {
        fail(description_error::unclosed_bracket, open, open + 1);
      }

      std::size_t
      skip_ws() {
        return cur_.consume_while(is_space).size();
      }

      // version = N, followed by ',' or the end of the description. Anything
      // that does not start with "version" and '=' is ordinary literal text.
      void
      read_version_directive() {
        cursor ahead = cur_;
        if (!ahead.consume("version")) return;
        ahead.consume_while(is_space);
        if (!ahead.consume('=')) return;
        cur_ = ahead;
        skip_ws();

        auto begin = cur_.offset();
        auto token =
            cur_.consume_while([](char c) { return !is_space(c) && c != ','; });
        auto end = cur_.offset();
        if (token.empty()) {
          fail(description_error::unexpected_token, begin, begin + 1,
               "expected a version number");
        }
        if (!std::all_of(token.begin(), token.end(), is_digit)) {
          fail(description_error::unexpected_token, begin, end,
               "version must be a number, found '" + std::string(token) +
                   "'");
        }
        if (token == "1")
          version_ = description_version::v1;
        else if (token == "2")
          version_ = description_version::v2;
        else
          fail(description_error::invalid_format_description_version, begin,
               end, "'" + std::string(token) + "'");

        skip_ws();
        if (cur_.at_end()) return;
        if (!cur_.consume(',')) {
          fail(description_error::unexpected_token, cur_.offset(),
               cur_.offset() + 1, "expected ',' after version directive");
        }
        skip_ws();
      }

      // Items up to the end of input, or up to (not including) the ']' that
      // closes a nested sequence opened at offset open.
      std::vector<format_item>
      parse_sequence(bool nested, std::size_t open) {
        std::vector<format_item> items;
        std::string literal;

        auto flush = [&] {
          if (literal.empty()) return;
          items.emplace_back(literal_item{std::move(literal)});
          literal.clear();
        };

        while (auto c = cur_.peek()) {
          if (*c == ']' && nested) break;

          if (*c == '[') {
            if (cur_.peek_at(1) == '[') {
              cur_.advance(2);
              literal += '[';
              continue;
            }
            flush();
            items.push_back(parse_bracket());
            continue;
          }

          if (*c == '\\' && version_ == description_version::v2) {
            literal += parse_escape();
            continue;
          }

          literal += *c;
          cur_.advance();
        }

        if (nested && cur_.at_end()) fail_unclosed(open);
        flush();
        return items;
      }

      char
      parse_escape() {
        auto begin = cur_.offset();
        cur_.advance();
        auto c = cur_.peek();
        if (!c) {
          fail(description_error::invalid_escape_sequence, begin, begin + 1,
               "trailing backslash");
        }
        if (*c != '\\' && *c != '[' && *c != ']') {
          fail(description_error::invalid_escape_sequence, begin, begin + 2,
               std::string("'\\") + *c + "'");
        }
        cur_.advance();
        return *c;
      }

      format_item
      parse_bracket() {
        auto open = cur_.offset();
        // Version 1 components cannot contain brackets, so a missing ']'
        // anywhere ahead is reported before the name is looked at.
        if (version_ == description_version::v1 &&
            cur_.remaining().find(']') == std::string_view::npos) {
          fail_unclosed(open);
        }
        cur_.advance();
        skip_ws();

        auto name_begin = cur_.offset();
        auto name = cur_.consume_while(is_name_char);
        if (name.empty()) {
          if (cur_.at_end()) fail_unclosed(open);
          fail(description_error::missing_component_name, open,
               cur_.offset() + 1);
        }

        if (version_ == description_version::v2) {
          if (name == "optional") return parse_optional(open);
          if (name == "first") return parse_first(open);
        }

        const auto* rule = find_component(name);
        if (!rule) {
          fail(description_error::invalid_component, name_begin,
               cur_.offset(), "'" + std::string(name) + "'");
        }
        return parse_modifiers(*rule, open);
      }

      component_spec
      parse_modifiers(const component_rule& rule, std::size_t open) {
        auto spec = default_component(rule.kind);
        std::vector<bool> present(rule.modifiers.size(), false);

        while (true) {
          auto ws = skip_ws();
          auto c = cur_.peek();
          if (!c) fail_unclosed(open);
          if (*c == ']') {
            cur_.advance();
            break;
          }

          auto key_begin = cur_.offset();
          if (ws == 0) {
            fail(description_error::unexpected_token, key_begin, key_begin + 1,
                 std::string("'") + *c + "'");
          }
          auto key = cur_.consume_while(is_name_char);
          auto key_end = cur_.offset();
          if (key.empty()) {
            fail(description_error::unexpected_token, key_begin, key_begin + 1,
                 std::string("'") + *c + "'");
          }

          const auto* mod = find_modifier(rule, key);
          if (!mod) {
            fail(description_error::invalid_modifier_key, key_begin, key_end,
                 "'" + std::string(key) + "' is not a modifier of '" +
                     std::string(rule.name) + "'");
          }

          if (!cur_.consume(':')) {
            fail(description_error::expected_modifier_value, key_begin,
                 key_end, "'" + std::string(key) + "'");
          }
          auto value_begin = cur_.offset();
          auto value = cur_.consume_while(
              [](char ch) { return !is_space(ch) && ch != ']'; });
          if (value.empty()) {
            fail(description_error::expected_modifier_value, key_begin,
                 value_begin, "'" + std::string(key) + "'");
          }
          if (!accepts_value(*mod, value)) {
            fail(description_error::invalid_modifier_value, value_begin,
                 cur_.offset(),
                 "'" + std::string(value) + "' for '" + std::string(key) +
                     "'");
          }

          apply_modifier(spec, key, value);
          present[static_cast<std::size_t>(mod - rule.modifiers.data())] = true;
        }

        for (std::size_t i = 0; i < rule.modifiers.size(); ++i) {
          if (rule.modifiers[i].required && !present[i]) {
            fail(description_error::missing_required_modifier, open,
                 cur_.offset(),
                 "'" + std::string(rule.name) + "' requires '" +
                     std::string(rule.modifiers[i].key) + "'");
          }
        }
        return spec;
      }

      std::vector<format_item>
      parse_nested(std::size_t outer_open) {
        if (cur_.at_end()) fail_unclosed(outer_open);
        auto open = cur_.offset();
        if (!cur_.next_is('[')) {
          fail(description_error::expected_opening_bracket, open, open + 1);
        }
        if (depth_ == max_nesting_depth) {
          fail(description_error::nesting_too_deep, open, open + 1);
        }
        cur_.advance();
        ++depth_;
        auto items = parse_sequence(true, open);
        --depth_;
        cur_.advance();
        return items;
      }

      void
      close_group(std::size_t open) {
        skip_ws();
        if (cur_.at_end()) fail_unclosed(open);
        if (!cur_.consume(']')) {
          fail(description_error::unexpected_token, cur_.offset(),
               cur_.offset() + 1, "expected ']'");
        }
      }

      format_item
      parse_optional(std::size_t open) {
        if (skip_ws() == 0) {
          if (cur_.at_end()) fail_unclosed(open);
          fail(description_error::expected_whitespace_after_optional,
               cur_.offset(), cur_.offset() + 1);
        }
        optional_item item{parse_nested(open)};
        close_group(open);
        return item;
      }

      format_item
      parse_first(std::size_t open) {
        if (skip_ws() == 0) {
          if (cur_.at_end()) fail_unclosed(open);
          fail(description_error::expected_whitespace_after_first,
               cur_.offset(), cur_.offset() + 1);
        }
        first_item item;
        item.alternatives.push_back(parse_nested(open));
        while (true) {
          skip_ws();
          if (cur_.at_end()) fail_unclosed(open);
          if (!cur_.next_is('[')) break;
          item.alternatives.push_back(parse_nested(open));
        }
        close_group(open);
        return item;
      }
    };

  } // namespace

  format_description
  description_parser::parse(std::string_view source) const {
    grammar g(source, default_version_);
    return g.parse();
  }

} // namespace tfd
