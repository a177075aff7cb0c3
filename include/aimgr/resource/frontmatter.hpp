#pragma once

#include "aimgr/common/result.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace aimgr::resource {

/// The leading `---` YAML block of a markdown resource. Scalars are kept as text,
/// sequences as their elements joined with ", ", and nested maps are dropped.
struct Frontmatter {
  std::map<std::string, std::string> values;
  std::map<std::string, std::vector<std::string>> lists;
  std::string body;
  bool present = false;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get(const std::string &key, const std::string &fallback = "") const;
};

[[nodiscard]] common::Result<Frontmatter> parse_frontmatter(const std::string &content);
[[nodiscard]] common::Result<Frontmatter> read_frontmatter(const std::filesystem::path &path);

} // namespace aimgr::resource
