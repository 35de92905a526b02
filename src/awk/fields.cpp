#include "byline/fields.hpp"
#include <cctype>
#include <system_error>
#include <fast_float/fast_float.h>

namespace bl {

std::vector<std::string> split_fields(std::string_view line, const std::regex& re) {
  if (line.empty()) return {std::string()};

  const char* b = line.data();
  const char* e = b + line.size();

  std::vector<std::string> out;
  std::size_t beg = 0, end = 0;
  bool have_prev = false;
  std::size_t prev_end = 0;
  for (std::cregex_iterator it(b, e, re), last; it != last; ++it) {
    const auto& m = (*it)[0];
    const std::size_t mpos = static_cast<std::size_t>(m.first - b);
    const std::size_t mend = static_cast<std::size_t>(m.second - b);
    // An empty match right where the previous match ended is not a separator.
    if (mpos == mend && have_prev && mpos == prev_end) continue;
    have_prev = true;
    prev_end = mend;
    end = mpos;
    if (mend != 0) out.emplace_back(line.substr(beg, end - beg));
    beg = mend;
  }
  if (end != line.size()) out.emplace_back(line.substr(beg));
  return out;
}

double to_number(std::string_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  // fast_float takes '-' but not '+'.
  if (i < s.size() && s[i] == '+') {
    ++i;
    if (i < s.size() && s[i] == '-') return 0.0;
  }
  if (i >= s.size()) return 0.0;

  // No "inf"/"nan" words, only digit-led numbers.
  std::size_t j = (s[i] == '-') ? i + 1 : i;
  if (j >= s.size() || !(std::isdigit(static_cast<unsigned char>(s[j])) || s[j] == '.')) return 0.0;

  double out = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data() + i, s.data() + s.size(), out);
  (void)ptr;
  if (ec != std::errc()) return 0.0;
  return out;
}

}
