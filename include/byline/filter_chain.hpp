#pragma once
#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "byline/status.hpp"

namespace bl {

// Canonical filter: rewrites the record in place and reports Ok, Omit,
// EndOfStream or Error.
using FilterFn = std::function<Status(std::string& record)>;

using ByteMap         = std::function<std::string(std::string_view)>;
using ByteMapErr      = std::function<Status(std::string_view in, std::string& out)>;
using StringMap       = std::function<std::string(const std::string&)>;
using StringMapErr    = std::function<Status(const std::string& in, std::string& out)>;
using BytePredicate   = std::function<bool(std::string_view)>;
using StringPredicate = std::function<bool(const std::string&)>;

// Ordered list of filters, applied left to right.
class FilterChain {
public:
  void append(FilterFn fn) { filters_.push_back(std::move(fn)); }

  // Stops at the first non-Ok filter; the record is cleared in that case and
  // the filter's status returned.
  Status apply(std::string& record) const;

  std::size_t size() const noexcept { return filters_.size(); }
  bool empty() const noexcept { return filters_.empty(); }

private:
  std::vector<FilterFn> filters_;
};

// Adapters onto FilterFn. Predicates map false to Omit.
namespace filters {

FilterFn map(ByteMap fn);
FilterFn map_err(ByteMapErr fn);
FilterFn map_string(StringMap fn);
FilterFn map_string_err(StringMapErr fn);
FilterFn grep(BytePredicate pred);
FilterFn grep_string(StringPredicate pred);
FilterFn grep_regex(std::regex re);

}

}
