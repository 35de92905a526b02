#pragma once
#include <cstddef>
#include <string>
#include <utility>

namespace bl {

// Outcome of a filter step or a pull.
//   Omit        -> drop this record, keep streaming
//   EndOfStream -> no more records (clean stop)
//   Error       -> hard failure, reported verbatim to the caller
enum class Signal { Ok, Omit, EndOfStream, Error };

class Status {
public:
  Status() = default;

  static Status ok() { return Status(); }
  static Status omit() { return Status(Signal::Omit, "omit record", 0); }
  static Status eof() { return Status(Signal::EndOfStream, "end of stream", 0); }
  static Status error(std::string message, int err_no = 0) {
    return Status(Signal::Error, std::move(message), err_no);
  }

  Signal signal() const noexcept { return signal_; }
  bool is_ok() const noexcept { return signal_ == Signal::Ok; }
  bool is_omit() const noexcept { return signal_ == Signal::Omit; }
  bool is_eof() const noexcept { return signal_ == Signal::EndOfStream; }
  bool is_error() const noexcept { return signal_ == Signal::Error; }

  const std::string& message() const noexcept { return message_; }
  int err_no() const noexcept { return err_no_; }

  // "ok", "omit", "eof" or "error: <message>"
  std::string to_string() const;

  friend bool operator==(const Status& a, const Status& b) {
    return a.signal_ == b.signal_ && a.message_ == b.message_ && a.err_no_ == b.err_no_;
  }
  friend bool operator!=(const Status& a, const Status& b) { return !(a == b); }

private:
  Status(Signal s, std::string message, int err_no)
    : signal_(s), message_(std::move(message)), err_no_(err_no) {}

  Signal signal_{Signal::Ok};
  std::string message_;
  int err_no_{0};
};

// Result of one pull: bytes written into the caller's buffer plus status.
// A source may hand back bytes together with EndOfStream.
struct ReadResult {
  std::size_t n = 0;
  Status status;
};

}
