#pragma once

#include <tfd/errors.hpp>
#include <tfd/format_item.hpp>
#include <tfd/value_provider.hpp>

#include <cstddef>
#include <string>

namespace tfd {

  // Append the rendering of description to out and return the number of
  // bytes appended. Throws format_error when a component outside of an
  // optional or first group cannot be rendered; out is left unchanged then.
  std::size_t
  render(const format_description& description, const value_provider& values,
         std::string& out);

  std::string
  format(const format_description& description, const value_provider& values);

} // namespace tfd
