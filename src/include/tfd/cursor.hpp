#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace tfd {

  // Byte position over a borrowed buffer. Copying a cursor is how callers
  // take a snapshot; assigning the copy back restores it.
  class cursor {
    std::string_view remaining_;
    std::size_t offset_ = 0;

  public:
    cursor() = default;
    explicit cursor(std::string_view bytes, std::size_t offset = 0)
        : remaining_(bytes), offset_(offset) {}

    std::size_t
    offset() const {
      return offset_;
    }

    std::string_view
    remaining() const {
      return remaining_;
    }

    bool
    at_end() const {
      return remaining_.empty();
    }

    std::optional<char>
    peek() const {
      if (remaining_.empty()) return std::nullopt;
      return remaining_.front();
    }

    std::optional<char>
    peek_at(std::size_t n) const {
      if (n >= remaining_.size()) return std::nullopt;
      return remaining_[n];
    }

    bool
    next_is(char c) const {
      return !remaining_.empty() && remaining_.front() == c;
    }

    void
    advance(std::size_t n = 1) {
      if (n > remaining_.size()) n = remaining_.size();
      remaining_.remove_prefix(n);
      offset_ += n;
    }

    // Consume a single byte if it equals c.
    bool
    consume(char c) {
      if (!next_is(c)) return false;
      advance();
      return true;
    }

    // Consume the exact prefix if present.
    bool
    consume(std::string_view prefix) {
      if (!remaining_.starts_with(prefix)) return false;
      advance(prefix.size());
      return true;
    }

    // Consume the longest run (at most max bytes) for which pred holds.
    template <typename Pred>
    std::string_view
    consume_while(Pred pred,
                  std::size_t max = std::string_view::npos) {
      std::size_t n = 0;
      while (n < remaining_.size() && n < max && pred(remaining_[n]))
        ++n;
      auto run = remaining_.substr(0, n);
      advance(n);
      return run;
    }
  };

} // namespace tfd
