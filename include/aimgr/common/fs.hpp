#pragma once

#include "aimgr/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

[[nodiscard]] std::filesystem::path absolute_path(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes through a sibling temp file and renames it over `path`.
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

[[nodiscard]] Status copy_tree(const std::filesystem::path &from, const std::filesystem::path &to);

/// True for anything at `path`, including a dangling symlink.
[[nodiscard]] bool entry_exists(const std::filesystem::path &path);

[[nodiscard]] std::string now_rfc3339();

} // namespace aimgr::common
