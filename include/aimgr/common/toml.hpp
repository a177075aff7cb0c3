#pragma once

#include "aimgr/common/result.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace aimgr::common {

/// Flat view of a TOML document: `section.key` -> raw value text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace aimgr::common
