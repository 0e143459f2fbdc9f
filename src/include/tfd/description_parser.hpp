#pragma once

#include <tfd/errors.hpp>
#include <tfd/format_item.hpp>

#include <cstddef>
#include <string_view>

namespace tfd {

  enum class description_version { v1 = 1, v2 = 2 };

  // Optional and first groups may nest at most this deep.
  inline constexpr std::size_t max_nesting_depth = 32;

  class description_parser {
  public:
    explicit description_parser(
        description_version default_version = description_version::v1)
        : default_version_(default_version) {}

    // Compile a description. Throws invalid_format_description on the first
    // error found.
    format_description
    parse(std::string_view source) const;

  private:
    description_version default_version_;
  };

  inline format_description
  compile(std::string_view source,
          description_version default_version = description_version::v1) {
    return description_parser(default_version).parse(source);
  }

} // namespace tfd
