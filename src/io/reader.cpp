#include "byline/reader.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace bl {

namespace {
constexpr std::size_t kMaxCopyBuffer = 64 * 1024 * 1024;
}

ReadResult StringReader::read(char* dst, std::size_t cap) {
  if (pos_ >= data_.size()) return {0, Status::eof()};
  const std::size_t n = std::min(cap, data_.size() - pos_);
  if (n) std::memcpy(dst, data_.data() + pos_, n);
  pos_ += n;
  return {n, Status::ok()};
}

// Blocks for one byte, then takes only what the stream already holds, so a
// pipe or terminal is consumed as data arrives.
ReadResult StreamReader::read(char* dst, std::size_t cap) {
  if (cap == 0) return {0, Status::ok()};
  in_.read(dst, 1);
  std::size_t n = static_cast<std::size_t>(in_.gcount());
  if (in_.bad()) return {n, Status::error("input stream read failed", errno)};
  if (n == 0) {
    if (in_.eof()) return {0, Status::eof()};
    return {0, Status::error("input stream is not readable", EIO)};
  }
  if (cap > 1) {
    n += static_cast<std::size_t>(in_.readsome(dst + 1, static_cast<std::streamsize>(cap - 1)));
    if (in_.bad()) return {n, Status::error("input stream read failed", errno)};
  }
  return {n, Status::ok()};
}

Status copy(Reader& src, std::ostream& out, std::uint64_t* written) {
  std::vector<char> buf(32 * 1024);
  std::uint64_t total = 0;
  while (true) {
    ReadResult r = src.read(buf.data(), buf.size());
    if (r.n > 0) {
      out.write(buf.data(), static_cast<std::streamsize>(r.n));
      if (!out) {
        if (written) *written = total;
        return Status::error("write to output stream failed", errno);
      }
      total += r.n;
    }
    if (r.status.is_ok()) continue;
    // Sources that keep an oversized record queued ask for a bigger buffer.
    if (r.n == 0 && r.status.is_error() && r.status.err_no() == ENOBUFS &&
        buf.size() < kMaxCopyBuffer) {
      buf.resize(std::min(buf.size() * 2, kMaxCopyBuffer));
      continue;
    }
    if (written) *written = total;
    return r.status.is_eof() ? Status::ok() : r.status;
  }
}

ReaderStreambuf::ReaderStreambuf(Reader& src, std::size_t buf_bytes)
  : src_(src), buf_(buf_bytes ? buf_bytes : 1) {
  setg(buf_.data(), buf_.data(), buf_.data());
}

ReaderStreambuf::int_type ReaderStreambuf::underflow() {
  if (gptr() < egptr()) return traits_type::to_int_type(*gptr());

  // Omitted records come back as n == 0 / Ok; keep pulling past them.
  while (status_.is_ok()) {
    ReadResult r = src_.read(buf_.data(), buf_.size());
    if (!r.status.is_ok()) status_ = r.status;
    if (r.n > 0) {
      setg(buf_.data(), buf_.data(), buf_.data() + r.n);
      return traits_type::to_int_type(*gptr());
    }
  }
  return traits_type::eof();
}

}
