#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

#include "byline/status.hpp"

namespace bl {

// Pull-based byte source. read() fills at most `cap` bytes of `dst`.
// Returning n == 0 with an Ok status is legal (nothing this round).
class Reader {
public:
  virtual ~Reader() = default;
  virtual ReadResult read(char* dst, std::size_t cap) = 0;
};

// In-memory source.
class StringReader : public Reader {
public:
  explicit StringReader(std::string data) : data_(std::move(data)) {}

  ReadResult read(char* dst, std::size_t cap) override;

  std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
  std::string data_;
  std::size_t pos_{0};
};

// Adapts a std::istream (not owned). read() waits for at least one byte and
// returns what is buffered past it, never a full `cap` by default.
class StreamReader : public Reader {
public:
  explicit StreamReader(std::istream& in) : in_(in) {}

  ReadResult read(char* dst, std::size_t cap) override;

private:
  std::istream& in_;
};

// Drain `src` into `out` until end of stream. EndOfStream is reported as Ok;
// any other non-ok status from the source is returned as is, except ENOBUFS,
// on which the copy buffer is doubled (up to 64 MiB) and the read retried.
Status copy(Reader& src, std::ostream& out, std::uint64_t* written = nullptr);

// std::streambuf over a Reader, so a Reader can back a std::istream.
// A source error ends the stream the same way EOF does; status() tells them apart.
class ReaderStreambuf : public std::streambuf {
public:
  explicit ReaderStreambuf(Reader& src, std::size_t buf_bytes = 64 * 1024);

  const Status& status() const noexcept { return status_; }

protected:
  int_type underflow() override;

private:
  Reader& src_;
  std::vector<char> buf_;
  Status status_;
};

}
