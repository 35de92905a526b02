#include "byline/filter_chain.hpp"
#include <utility>

namespace bl {

Status FilterChain::apply(std::string& record) const {
  for (const auto& f : filters_) {
    Status s = f(record);
    if (s.is_ok()) continue;
    record.clear();
    return s;
  }
  return Status::ok();
}

namespace filters {

FilterFn map(ByteMap fn) {
  return map_err([fn = std::move(fn)](std::string_view in, std::string& out) {
    out = fn(in);
    return Status::ok();
  });
}

FilterFn map_err(ByteMapErr fn) {
  return [fn = std::move(fn)](std::string& record) {
    std::string out;
    Status s = fn(std::string_view(record), out);
    record = std::move(out);
    return s;
  };
}

FilterFn map_string(StringMap fn) {
  return [fn = std::move(fn)](std::string& record) {
    record = fn(record);
    return Status::ok();
  };
}

FilterFn map_string_err(StringMapErr fn) {
  return [fn = std::move(fn)](std::string& record) {
    std::string out;
    Status s = fn(record, out);
    record = std::move(out);
    return s;
  };
}

FilterFn grep(BytePredicate pred) {
  return [pred = std::move(pred)](std::string& record) {
    return pred(std::string_view(record)) ? Status::ok() : Status::omit();
  };
}

FilterFn grep_string(StringPredicate pred) {
  return [pred = std::move(pred)](std::string& record) {
    return pred(record) ? Status::ok() : Status::omit();
  };
}

FilterFn grep_regex(std::regex re) {
  return grep([re = std::move(re)](std::string_view line) {
    return std::regex_search(line.begin(), line.end(), re);
  });
}

}

}
