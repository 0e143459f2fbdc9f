#pragma once

#include <tfd/component.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tfd {

  class format_item;

  // ---------------------------------------------------------------------------
  // Item node types
  // ---------------------------------------------------------------------------

  struct literal_item {
    std::string bytes;
  };

  // Items that are matched or rendered only when all of them succeed.
  struct optional_item {
    std::vector<format_item> items;
  };

  // Alternatives tried in order; the first one that succeeds is used.
  struct first_item {
    std::vector<std::vector<format_item>> alternatives;
  };

  inline bool
  operator==(const literal_item& a, const literal_item& b);

  inline bool
  operator==(const optional_item& a, const optional_item& b);

  inline bool
  operator==(const first_item& a, const first_item& b);

  // ---------------------------------------------------------------------------
  // Format item
  // ---------------------------------------------------------------------------

  class format_item {
  public:
    using variant_type =
        std::variant<literal_item, component_spec, optional_item, first_item>;

    format_item(variant_type v) : data_(std::move(v)) {}

    format_item(literal_item v) : data_(std::move(v)) {}

    format_item(component_spec v) : data_(v) {}

    format_item(optional_item v) : data_(std::move(v)) {}

    format_item(first_item v) : data_(std::move(v)) {}

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    friend bool
    operator==(const format_item& a, const format_item& b);

  private:
    variant_type data_;
  };

  inline bool
  operator==(const format_item& a, const format_item& b) {
    return a.data_ == b.data_;
  }

  inline bool
  operator==(const literal_item& a, const literal_item& b) {
    return a.bytes == b.bytes;
  }

  inline bool
  operator==(const optional_item& a, const optional_item& b) {
    return a.items == b.items;
  }

  inline bool
  operator==(const first_item& a, const first_item& b) {
    return a.alternatives == b.alternatives;
  }

  // A compiled format description: the top-level item sequence.
  using format_description = std::vector<format_item>;

} // namespace tfd
