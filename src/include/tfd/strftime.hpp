#pragma once

#include <tfd/errors.hpp>
#include <tfd/format_item.hpp>

#include <string_view>

namespace tfd {

  // Compile a strftime-style description (`%Y-%m-%dT%H:%M:%S`) into the same
  // item tree compile() produces. A conversion may carry one padding flag:
  // `_` pads with spaces, `-` removes padding and `0` pads with zeros.
  // Composite conversions such as `%F` and `%T` expand into their items.
  // Throws invalid_format_description; `%O` and `%Z` are not_supported.
  format_description
  compile_strftime(std::string_view source);

} // namespace tfd
