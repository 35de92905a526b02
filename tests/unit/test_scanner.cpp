#include "byline/reader.hpp"
#include "byline/scanner.hpp"

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

int failures = 0;

void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Hands out one byte per read().
class DripReader : public bl::Reader {
public:
  explicit DripReader(std::string s) : s_(std::move(s)) {}
  bl::ReadResult read(char* dst, std::size_t cap) override {
    if (pos_ >= s_.size()) return {0, bl::Status::eof()};
    if (cap == 0) return {0, bl::Status::ok()};
    dst[0] = s_[pos_++];
    return {1, bl::Status::ok()};
  }
private:
  std::string s_;
  std::size_t pos_{0};
};

// Returns its payload, then fails.
class FailingReader : public bl::Reader {
public:
  explicit FailingReader(std::string s) : s_(std::move(s)) {}
  bl::ReadResult read(char* dst, std::size_t cap) override {
    if (!sent_) {
      sent_ = true;
      std::size_t n = std::min(cap, s_.size());
      s_.copy(dst, n);
      return {n, bl::Status::ok()};
    }
    return {0, bl::Status::error("device gone", EIO)};
  }
private:
  std::string s_;
  bool sent_{false};
};

// Never produces anything and never ends.
class StuckReader : public bl::Reader {
public:
  bl::ReadResult read(char*, std::size_t) override { return {0, bl::Status::ok()}; }
};

std::vector<std::string> scan_all(bl::Reader& r, char rs, bl::Scanner::Config cfg,
                                  bl::Status* final_status = nullptr) {
  bl::Scanner sc(r, cfg);
  std::vector<std::string> out;
  std::string_view tok;
  while (sc.scan(rs, tok)) out.emplace_back(tok);
  if (final_status) *final_status = sc.status();
  return out;
}

std::vector<std::string> scan_string(const std::string& s, char rs = '\n', std::size_t chunk = 4) {
  bl::StringReader r(s);
  bl::Scanner::Config cfg;
  cfg.chunk_bytes = chunk;
  return scan_all(r, rs, cfg);
}

void test_split_record() {
  std::size_t adv = 0;
  std::string_view tok;

  check(bl::split_record("ab\ncd", false, '\n', adv, tok), "split: separator found");
  check(adv == 3 && tok == "ab\n", "split: token keeps its separator");

  check(!bl::split_record("abc", false, '\n', adv, tok), "split: incomplete record waits");
  check(adv == 0, "split: nothing consumed while waiting");

  check(bl::split_record("abc", true, '\n', adv, tok), "split: final record at eof");
  check(adv == 3 && tok == "abc", "split: final record has no separator");

  check(!bl::split_record("", true, '\n', adv, tok), "split: empty at eof gives nothing");

  check(bl::split_record("\nxyz", false, '\n', adv, tok), "split: leading separator");
  check(adv == 1 && tok == "\n", "split: record is the separator alone");

  check(bl::split_record("a;b", false, ';', adv, tok) && tok == "a;", "split: custom separator");
}

void test_counts() {
  // N separators with a non-empty tail -> N + 1 records
  auto v = scan_string("a\nbb\nccc");
  check(v.size() == 3, "tail: 3 records");
  check(v.size() == 3 && v[0] == "a\n" && v[1] == "bb\n" && v[2] == "ccc", "tail: record contents");

  // N separators, empty tail -> N records
  v = scan_string("a\nbb\n");
  check(v.size() == 2 && v[1] == "bb\n", "no tail: 2 records");

  v = scan_string("");
  check(v.empty(), "empty input: zero records");

  v = scan_string("\n\n");
  check(v.size() == 2 && v[0] == "\n" && v[1] == "\n", "blank lines are records");

  v = scan_string("x|y|z", '|');
  check(v.size() == 3 && v[0] == "x|" && v[2] == "z", "pipe separator");
}

void test_partial_buffers() {
  // Records longer than the chunk force growth; a drip source forces many refills.
  std::string line(100, 'q');
  auto v = scan_string(line + "\n" + line, '\n', 3);
  check(v.size() == 2 && v[0].size() == 101 && v[1].size() == 100, "growth past chunk size");

  DripReader drip("one\ntwo\nthree");
  bl::Status st;
  auto d = scan_all(drip, '\n', bl::Scanner::Config{}, &st);
  check(d.size() == 3 && d[0] == "one\n" && d[2] == "three", "drip: records");
  check(st.is_eof(), "drip: clean end of stream");
}

void test_source_error() {
  FailingReader r("ok\npartial");
  bl::Status st;
  auto v = scan_all(r, '\n', bl::Scanner::Config{}, &st);
  check(v.size() == 2 && v[0] == "ok\n" && v[1] == "partial", "error: buffered bytes still delivered");
  check(st.is_error() && st.err_no() == EIO && st.message() == "device gone", "error: passed through verbatim");
}

void test_guards() {
  bl::StringReader r(std::string(64, 'x') + "\n");
  bl::Scanner::Config cfg;
  cfg.chunk_bytes = 8;
  cfg.max_record_bytes = 16;
  bl::Status st;
  auto v = scan_all(r, '\n', cfg, &st);
  check(v.empty(), "guard: oversize record not returned");
  check(st.is_error() && st.err_no() == EMSGSIZE, "guard: EMSGSIZE");

  StuckReader stuck;
  v = scan_all(stuck, '\n', bl::Scanner::Config{}, &st);
  check(v.empty() && st.is_error() && st.err_no() == EIO, "guard: no progress");
}

}

int main() {
  test_split_record();
  test_counts();
  test_partial_buffers();
  test_source_error();
  test_guards();

  if (failures) { std::cerr << "[FAIL] scanner: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] scanner\n";
  return 0;
}
