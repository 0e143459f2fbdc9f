#pragma once

#include <tfd/format_item.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tfd {

  // One line of a descriptions file: `<identifier> <description>`.
  struct description_entry {
    std::string name;
    std::string source;
    // 1-based line in the descriptions file.
    std::size_t line = 0;
    // Byte offset of the description within that line.
    std::size_t column = 0;
  };

  // Split a descriptions file into entries. Blank lines and lines whose first
  // non-blank character is '#' are skipped. Throws std::invalid_argument on a
  // malformed identifier, a missing description or a duplicate name.
  std::vector<description_entry>
  read_descriptions(std::string_view text);

  struct embedded_description {
    std::string name;
    format_description description;
  };

  // Writes a header declaring one accessor per description, each returning a
  // function-local static format_description equal to what compile() builds.
  class embed_writer {
  public:
    explicit embed_writer(std::string ns = "tfd_embedded")
        : namespace_(std::move(ns)) {}

    std::string
    write(const std::vector<embedded_description>& descriptions) const;

  private:
    std::string namespace_;
  };

  // True if s is usable as a C++ identifier (or a `::`-separated namespace
  // path when qualified is set).
  bool
  is_identifier(std::string_view s, bool qualified = false);

} // namespace tfd
