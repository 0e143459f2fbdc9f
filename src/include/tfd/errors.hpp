#pragma once

#include <tfd/component.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tfd {

  // Half-open byte range [begin, end) within a description or input.
  struct byte_span {
    std::size_t begin = 0;
    std::size_t end = 0;

    bool
    operator==(const byte_span&) const = default;
  };

  // ---------------------------------------------------------------------------
  // Compile-time errors
  // ---------------------------------------------------------------------------

  enum class description_error {
    missing_component_name,
    invalid_component,
    invalid_modifier_key,
    invalid_modifier_value,
    expected_modifier_value,
    missing_required_modifier,
    unclosed_bracket,
    expected_opening_bracket,
    expected_whitespace_after_optional,
    expected_whitespace_after_first,
    invalid_escape_sequence,
    unexpected_token,
    invalid_format_description_version,
    nesting_too_deep,
    not_supported,
  };

  std::string_view
  to_string(description_error kind);

  class invalid_format_description : public std::invalid_argument {
    description_error kind_;
    byte_span span_;

  public:
    invalid_format_description(description_error kind, byte_span span,
                               const std::string& detail);

    description_error
    kind() const {
      return kind_;
    }

    byte_span
    span() const {
      return span_;
    }
  };

  // ---------------------------------------------------------------------------
  // Run-time errors
  // ---------------------------------------------------------------------------

  enum class parse_error_kind {
    invalid_literal,
    invalid_component_value,
    inconsistent_parsed_field,
    unexpected_trailing_characters,
  };

  std::string_view
  to_string(parse_error_kind kind);

  class parse_error : public std::runtime_error {
    parse_error_kind kind_;
    std::optional<component_kind> component_;
    std::size_t offset_;

  public:
    parse_error(parse_error_kind kind, std::optional<component_kind> component,
                std::size_t offset);

    parse_error_kind
    kind() const {
      return kind_;
    }

    std::optional<component_kind>
    component() const {
      return component_;
    }

    std::size_t
    offset() const {
      return offset_;
    }
  };

  enum class format_error_kind {
    unsupported_component,
    invalid_component_value,
  };

  std::string_view
  to_string(format_error_kind kind);

  class format_error : public std::runtime_error {
    format_error_kind kind_;
    component_kind component_;

  public:
    format_error(format_error_kind kind, component_kind component);

    format_error_kind
    kind() const {
      return kind_;
    }

    component_kind
    component() const {
      return component_;
    }
  };

} // namespace tfd
