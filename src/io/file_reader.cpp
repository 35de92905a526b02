#include "byline/file_reader.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace bl {

struct FileReader::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t bytes{0};
  bool opened{false};

  ~Impl() { if (f) std::fclose(f); }

  bool open() {
    if (opened) return f != nullptr;
    opened = true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }
    return true;
  }

  ReadResult read(char* dst, std::size_t cap) {
    if (!open()) {
      return {0, Status::error("cannot open " + path + ": " + std::strerror(last_errno), last_errno)};
    }
    if (cap == 0) return {0, Status::ok()};

    const std::size_t want = std::min(cap, cfg.chunk_bytes ? cfg.chunk_bytes : cap);
    std::size_t n = std::fread(dst, 1, want, f);
    bytes += n;
    if (n == 0 && std::ferror(f)) {
      last_errno = errno;
      return {0, Status::error("read failed on " + path + ": " + std::strerror(last_errno), last_errno)};
    }
    if (n == 0 && std::feof(f)) return {0, Status::eof()};
    return {n, Status::ok()};
  }
};

FileReader::FileReader(std::string path)
  : FileReader(std::move(path), Config{}) {}

FileReader::FileReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

FileReader::~FileReader() { delete p_; }

bool FileReader::open() { return p_->open(); }
ReadResult FileReader::read(char* dst, std::size_t cap) { return p_->read(dst, cap); }
const std::string& FileReader::path() const noexcept { return p_->path; }
int  FileReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileReader::bytes_read() const noexcept { return p_->bytes; }

}
