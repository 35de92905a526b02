#pragma once
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bl {

// Split `line` on every match of `re` (no limit).
//   ""          -> {""}
//   " a b"      -> {"", "a", "b"}    (leading match gives an empty field)
//   "a b "      -> {"a", "b", ""}    (so does a trailing one)
// An empty match at offset 0 does not start a field.
std::vector<std::string> split_fields(std::string_view line, const std::regex& re);

// AWK string -> number coercion: leading blanks skipped, longest numeric
// prefix parsed, 0 when there is none ("3.5kg" -> 3.5, "abc" -> 0).
double to_number(std::string_view s) noexcept;

// Fields of one record. Owns its line and values, so a copy stays valid after
// the awk callback returns; the views it hands out live as long as the object.
// at(i) is 0-based; field(n) is AWK-style: field(0) is the whole line,
// field(1) the first field. Out of range gives an empty view.
class Fields {
public:
  Fields() = default;
  Fields(std::string_view line, std::vector<std::string> values)
      : line_(line), values_(std::move(values)) {}

  std::size_t size() const noexcept { return values_.size(); }
  bool empty() const noexcept { return values_.empty(); }

  std::string_view at(std::size_t i) const {
    return i < values_.size() ? std::string_view(values_[i]) : std::string_view{};
  }

  std::string_view field(std::size_t n) const {
    if (n == 0) return line_;
    return at(n - 1);
  }

  double number(std::size_t n) const noexcept { return to_number(field(n)); }

  std::string_view line() const noexcept { return line_; }
  const std::vector<std::string>& values() const noexcept { return values_; }

  std::vector<std::string>::const_iterator begin() const noexcept { return values_.begin(); }
  std::vector<std::string>::const_iterator end() const noexcept { return values_.end(); }

private:
  std::string line_;
  std::vector<std::string> values_;
};

}
