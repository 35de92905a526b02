#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

#include "byline/reader.hpp"
#include "byline/status.hpp"

namespace bl {

// Record boundary detection over an accumulated buffer.
//   - separator found       -> token = data[0 .. sep] (separator included)
//   - no separator, at_eof  -> token = all of data (unterminated final record)
//   - otherwise             -> no token, caller must supply more data
// Empty data at EOF yields no token. Returns true when `token` was produced;
// `advance` is the number of bytes consumed.
bool split_record(std::string_view data, bool at_eof, char rs,
                  std::size_t& advance, std::string_view& token) noexcept;

// Pulls bytes from a Reader into an owned buffer and hands out one record per
// scan(). The returned view stays valid until the next scan().
class Scanner {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;       // initial buffer / growth step
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per record
    int         max_empty_reads  = 100;             // consecutive n == 0 reads; 0 = no limit
  };

  explicit Scanner(Reader& src);
  Scanner(Reader& src, Config cfg);

  // False once no record remains; status() then says why
  // (EndOfStream, or the source's / guard's error).
  bool scan(char rs, std::string_view& token);

  const Status& status() const noexcept { return status_; }
  std::size_t buffered() const noexcept { return end_ - start_; }

private:
  bool fill();

  Reader& src_;
  Config cfg_;
  std::vector<char> buf_;
  std::size_t start_{0};
  std::size_t end_{0};
  int empty_reads_{0};
  bool at_eof_{false};
  bool done_{false};
  Status status_;
};

}
