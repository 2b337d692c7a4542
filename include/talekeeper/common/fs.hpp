#pragma once

#include "talekeeper/common/result.hpp"
#include <filesystem>
#include <string>

namespace talekeeper::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Map an identifier onto a safe file stem ([A-Za-z0-9_-], everything else becomes '_').
[[nodiscard]] std::string sanitize_filename(const std::string &value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write through a sibling ".tmp" file and rename it over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace talekeeper::common
