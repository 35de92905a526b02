#include "byline/status.hpp"

namespace bl {

std::string Status::to_string() const {
  switch (signal_) {
    case Signal::Ok:          return "ok";
    case Signal::Omit:        return "omit";
    case Signal::EndOfStream: return "eof";
    case Signal::Error:       break;
  }
  std::string out = "error: " + message_;
  if (err_no_ != 0) out += " (errno " + std::to_string(err_no_) + ")";
  return out;
}

}
