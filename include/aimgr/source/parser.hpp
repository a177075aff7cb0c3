#pragma once

#include "aimgr/common/result.hpp"

#include <string>

namespace aimgr::source {

enum class SourceKind {
  GitHub,
  GitLab,
  GitUrl,
  Local,
};

struct ParsedSource {
  SourceKind kind = SourceKind::Local;
  std::string url;
  std::string local_path;
  std::string ref;
  std::string subpath;

  [[nodiscard]] bool is_remote() const { return kind != SourceKind::Local; }
  [[nodiscard]] std::string clone_url() const;
};

/// Canonical form of a remote location: trimmed, lowercased, without a trailing "/"
/// or ".git". Used for source IDs and workspace cache keys.
[[nodiscard]] std::string normalize_url(const std::string &url);

/// Accepts `gh:owner/repo[@ref][/subpath]`, `owner/repo`, http(s) and file:// URLs,
/// `git@host:owner/repo`, `local:<path>`, and `./`, `../` or absolute paths.
[[nodiscard]] common::Result<ParsedSource> parse_source(const std::string &input);

} // namespace aimgr::source
