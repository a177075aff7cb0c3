#include "aimgr/common/fs.hpp"
#include "aimgr/common/hash.hpp"
#include "aimgr/manifest/manifest.hpp"
#include "aimgr/source/parser.hpp"

#include <regex>

namespace aimgr::manifest {

namespace {

std::string collapse_hyphens(std::string value) {
  std::string::size_type pos = 0;
  while ((pos = value.find("--")) != std::string::npos) {
    value.erase(pos, 1);
  }
  return value;
}

std::string trim_hyphens(const std::string &value) {
  const auto begin = value.find_first_not_of('-');
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of('-');
  return value.substr(begin, end - begin + 1);
}

} // namespace

resource::ImportMode Source::import_mode() const {
  if (const auto explicit_mode = resource::parse_import_mode(mode); explicit_mode.has_value()) {
    return *explicit_mode;
  }
  return is_remote() ? resource::ImportMode::Copy : resource::ImportMode::Symlink;
}

std::string generate_source_id(const Source &source) {
  std::string canonical;
  if (!source.url.empty()) {
    canonical = source::normalize_url(source.url);
  } else if (!source.path.empty()) {
    canonical = common::absolute_path(source.path).string();
  } else {
    return "";
  }
  return "src-" + common::sha256_hex(canonical).substr(0, 12);
}

std::string generate_source_name(const Source &source) {
  std::string base;
  if (!source.path.empty()) {
    base = common::absolute_path(source.path).filename().string();
  } else if (!source.url.empty()) {
    std::string url = common::trim(source.url);
    while (common::ends_with(url, "/")) {
      url.pop_back();
    }
    if (common::ends_with(url, ".git")) {
      url.resize(url.size() - 4);
    }
    const auto slash = url.find_last_of('/');
    base = slash == std::string::npos ? url : url.substr(slash + 1);
    // git@host:repo without an owner segment
    const auto colon = base.find_last_of(':');
    if (colon != std::string::npos) {
      base = base.substr(colon + 1);
    }
  }

  std::string name = common::to_lower(base);
  for (auto &ch : name) {
    const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
    if (!allowed) {
      ch = '-';
    }
  }
  name = trim_hyphens(collapse_hyphens(name));
  if (name.size() > MAX_SOURCE_NAME_LENGTH) {
    name = trim_hyphens(name.substr(0, MAX_SOURCE_NAME_LENGTH));
  }
  return name.empty() ? "source" : name;
}

bool is_valid_source_name(const std::string &name) {
  static const std::regex pattern("^[a-z0-9]([a-z0-9-]*[a-z0-9])?$");
  if (name.empty() || name.size() > MAX_SOURCE_NAME_LENGTH) {
    return false;
  }
  return name.find("--") == std::string::npos && std::regex_match(name, pattern);
}

} // namespace aimgr::manifest
