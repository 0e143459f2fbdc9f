#include <tfd/errors.hpp>

namespace tfd {

  namespace {

    std::string
    describe(description_error kind, byte_span span,
             const std::string& detail) {
      std::string msg(to_string(kind));
      msg += " at bytes ";
      msg += std::to_string(span.begin);
      msg += "..";
      msg += std::to_string(span.end);
      if (!detail.empty()) {
        msg += ": ";
        msg += detail;
      }
      return msg;
    }

    std::string
    describe(parse_error_kind kind, std::optional<component_kind> component,
             std::size_t offset) {
      std::string msg;
      switch (kind) {
        case parse_error_kind::invalid_literal:
          msg = "a character literal was not valid";
          break;
        case parse_error_kind::invalid_component_value:
          msg = "the '";
          msg += component ? to_string(*component) : "unknown";
          msg += "' component could not be parsed";
          break;
        case parse_error_kind::inconsistent_parsed_field:
          msg = "the '";
          msg += component ? to_string(*component) : "unknown";
          msg += "' component conflicts with a previously parsed value";
          break;
        case parse_error_kind::unexpected_trailing_characters:
          msg = "unexpected trailing characters";
          break;
      }
      msg += " at offset ";
      msg += std::to_string(offset);
      return msg;
    }

    std::string
    describe(format_error_kind kind, component_kind component) {
      std::string msg = "the '";
      msg += to_string(component);
      if (kind == format_error_kind::unsupported_component)
        msg += "' component is not available from the value being formatted";
      else
        msg += "' component cannot be formatted from the supplied value";
      return msg;
    }

  } // namespace

  std::string_view
  to_string(description_error kind) {
    switch (kind) {
      case description_error::missing_component_name:
        return "missing component name";
      case description_error::invalid_component:
        return "invalid component";
      case description_error::invalid_modifier_key:
        return "invalid modifier key";
      case description_error::invalid_modifier_value:
        return "invalid modifier value";
      case description_error::expected_modifier_value:
        return "expected modifier value";
      case description_error::missing_required_modifier:
        return "missing required modifier";
      case description_error::unclosed_bracket:
        return "unclosed bracket";
      case description_error::expected_opening_bracket:
        return "expected opening bracket";
      case description_error::expected_whitespace_after_optional:
        return "expected whitespace after 'optional'";
      case description_error::expected_whitespace_after_first:
        return "expected whitespace after 'first'";
      case description_error::invalid_escape_sequence:
        return "invalid escape sequence";
      case description_error::unexpected_token:
        return "unexpected token";
      case description_error::invalid_format_description_version:
        return "invalid format description version";
      case description_error::nesting_too_deep:
        return "nesting too deep";
      case description_error::not_supported:
        return "not supported";
    }
    return "unknown error";
  }

  std::string_view
  to_string(parse_error_kind kind) {
    switch (kind) {
      case parse_error_kind::invalid_literal:
        return "invalid literal";
      case parse_error_kind::invalid_component_value:
        return "invalid component value";
      case parse_error_kind::inconsistent_parsed_field:
        return "inconsistent parsed field";
      case parse_error_kind::unexpected_trailing_characters:
        return "unexpected trailing characters";
    }
    return "unknown error";
  }

  std::string_view
  to_string(format_error_kind kind) {
    switch (kind) {
      case format_error_kind::unsupported_component:
        return "unsupported component";
      case format_error_kind::invalid_component_value:
        return "invalid component value";
    }
    return "unknown error";
  }

  invalid_format_description::invalid_format_description(
      description_error kind, byte_span span, const std::string& detail)
      : std::invalid_argument(describe(kind, span, detail)), kind_(kind),
        span_(span) {}

  parse_error::parse_error(parse_error_kind kind,
                           std::optional<component_kind> component,
                           std::size_t offset)
      : std::runtime_error(describe(kind, component, offset)), kind_(kind),
        component_(component), offset_(offset) {}

  format_error::format_error(format_error_kind kind, component_kind component)
      : std::runtime_error(describe(kind, component)), kind_(kind),
        component_(component) {}

} // namespace tfd
