#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "byline/reader.hpp"

namespace bl {

// Reads a file in fixed-size fread() chunks. The file is opened lazily on the
// first read() (or by open()) and closed on destruction.
class FileReader : public Reader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB per fread
  };

  explicit FileReader(std::string path);   // uses default Config{}
  FileReader(std::string path, Config cfg);
  ~FileReader() override;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  bool open();
  ReadResult read(char* dst, std::size_t cap) override;

  const std::string& path() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
