#include "byline/scanner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace bl {

bool split_record(std::string_view data, bool at_eof, char rs,
                  std::size_t& advance, std::string_view& token) noexcept {
  advance = 0;
  if (at_eof && data.empty()) return false;

  std::size_t pos = data.find(rs);
  if (pos != std::string_view::npos) {
    advance = pos + 1;
    token = data.substr(0, pos + 1);
    return true;
  }
  // Final, non-terminated record.
  if (at_eof) {
    advance = data.size();
    token = data;
    return true;
  }
  return false;
}

Scanner::Scanner(Reader& src) : Scanner(src, Config{}) {}

Scanner::Scanner(Reader& src, Config cfg) : src_(src), cfg_(cfg) {
  if (cfg_.chunk_bytes == 0) cfg_.chunk_bytes = 4096;
  if (cfg_.max_record_bytes == 0) cfg_.max_record_bytes = cfg_.chunk_bytes;
}

bool Scanner::scan(char rs, std::string_view& token) {
  if (done_) return false;

  while (true) {
    if (end_ > start_ || at_eof_) {
      std::size_t advance = 0;
      std::string_view data(buf_.data() + start_, end_ - start_);
      if (split_record(data, at_eof_, rs, advance, token)) {
        start_ += advance;
        return true;
      }
      if (at_eof_) {
        start_ = end_ = 0;
        done_ = true;
        return false;
      }
    }
    if (!fill()) {
      start_ = end_ = 0;
      done_ = true;
      return false;
    }
  }
}

// Makes room and reads once. Returns false when the scanner must stop right
// away (record guard tripped); source errors and EOF only set at_eof_ so the
// bytes already buffered still come out as a final record.
bool Scanner::fill() {
  if (end_ - start_ >= cfg_.max_record_bytes) {
    status_ = Status::error("record exceeds " + std::to_string(cfg_.max_record_bytes) +
                            " bytes without a separator", EMSGSIZE);
    return false;
  }

  if (start_ > 0) {
    std::memmove(buf_.data(), buf_.data() + start_, end_ - start_);
    end_ -= start_;
    start_ = 0;
  }

  if (end_ == buf_.size()) {
    std::size_t grow = buf_.empty() ? cfg_.chunk_bytes : buf_.size() * 2;
    grow = std::min(grow, cfg_.max_record_bytes);
    buf_.resize(std::max(grow, end_ + 1));
  }

  ReadResult r = src_.read(buf_.data() + end_, buf_.size() - end_);
  end_ += std::min(r.n, buf_.size() - end_);

  if (!r.status.is_ok()) {
    status_ = r.status.is_error() ? r.status : Status::eof();
    at_eof_ = true;
    return true;
  }

  if (r.n > 0) {
    empty_reads_ = 0;
  } else if (cfg_.max_empty_reads > 0 && ++empty_reads_ >= cfg_.max_empty_reads) {
    status_ = Status::error("source returned no data after " +
                            std::to_string(cfg_.max_empty_reads) + " reads", EIO);
    at_eof_ = true;
  }
  return true;
}

}
