#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace bl {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Write `data` to `p` (parents created); on failure fills *err_out.
bool write_text_file(const std::filesystem::path& p, std::string_view data,
                     std::string* err_out = nullptr);

}
