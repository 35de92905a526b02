#include "byline/path_utils.hpp"
#include <fstream>

namespace bl {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool write_text_file(const std::filesystem::path& p, std::string_view data,
                     std::string* err_out) {
  if (!ensure_parent_dirs(p)) {
    if (err_out) *err_out = "cannot create parent directory of " + p.string();
    return false;
  }
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "cannot open " + p.string() + " for writing";
    return false;
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) {
    if (err_out) *err_out = "write failed: " + p.string();
    return false;
  }
  return true;
}

}
