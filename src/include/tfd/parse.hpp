#pragma once

#include <tfd/errors.hpp>
#include <tfd/format_item.hpp>
#include <tfd/parsed.hpp>

#include <cstddef>
#include <string_view>

namespace tfd {

  struct parse_result {
    parsed fields;
    // Bytes of the input matched by the description.
    std::size_t consumed = 0;
  };

  // Match description against a prefix of input. Input left over after the
  // last item is not an error here. Throws parse_error.
  parse_result
  parse(const format_description& description, std::string_view input);

  // As parse, but the whole input must be matched.
  parsed
  parse_exact(const format_description& description, std::string_view input);

} // namespace tfd
