#pragma once

#include "chronicle/common/result.hpp"
#include <filesystem>
#include <string>

namespace chronicle::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file into memory. Missing files are a failure.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Replace `path` with `content` through a sibling temp file and a rename.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace chronicle::common
