#include "aimgr/source/parser.hpp"

#include "aimgr/common/fs.hpp"

#include <regex>

namespace aimgr::source {

namespace {

const std::regex &owner_repo_pattern() {
  static const std::regex pattern("^([a-zA-Z0-9_-]+)/([a-zA-Z0-9_.-]+)$");
  return pattern;
}

const std::regex &github_url_pattern() {
  static const std::regex pattern("^https?://github\\.com/([a-zA-Z0-9_-]+)/([a-zA-Z0-9_.-]+).*");
  return pattern;
}

std::string strip_git_suffix(std::string value) {
  if (common::ends_with(value, ".git")) {
    value.resize(value.size() - 4);
  }
  return value;
}

common::Result<ParsedSource> parse_github_shorthand(const std::string &input) {
  if (input.empty()) {
    return common::Result<ParsedSource>::failure("GitHub source cannot be empty");
  }

  std::string repo_path = input;
  std::string ref;
  std::string ref_subpath;
  const auto at = input.find('@');
  if (at != std::string::npos) {
    repo_path = input.substr(0, at);
    const std::string ref_and_path = input.substr(at + 1);
    const auto slash = ref_and_path.find('/');
    ref = ref_and_path.substr(0, slash);
    if (slash != std::string::npos) {
      ref_subpath = ref_and_path.substr(slash + 1);
    }
  }

  const auto parts = common::split(repo_path, '/');
  if (parts.size() < 2) {
    return common::Result<ParsedSource>::failure(
        "invalid GitHub source format: must be owner/repo");
  }
  const std::string owner = parts[0];
  const std::string repo = strip_git_suffix(parts[1]);
  if (owner.empty() || repo.empty()) {
    return common::Result<ParsedSource>::failure("GitHub owner and repo cannot be empty");
  }

  std::string subpath;
  for (std::size_t i = 2; i < parts.size(); ++i) {
    subpath += (subpath.empty() ? "" : "/") + parts[i];
  }
  if (!ref_subpath.empty()) {
    subpath = ref_subpath;
  }

  std::string url = "https://github.com/" + owner + "/" + repo;
  if (!ref.empty()) {
    url += "/tree/" + ref;
  }
  return common::Result<ParsedSource>::success(
      ParsedSource{.kind = SourceKind::GitHub, .url = url, .ref = ref, .subpath = subpath});
}

common::Result<ParsedSource> parse_github_url(const std::string &input) {
  std::string rest = strip_git_suffix(input);
  rest = rest.substr(rest.find("github.com/") + std::string("github.com/").size());
  while (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }

  const auto parts = common::split(rest, '/');
  if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
    return common::Result<ParsedSource>::failure(
        "invalid GitHub URL: must include owner and repo");
  }

  ParsedSource parsed{.kind = SourceKind::GitHub,
                      .url = "https://github.com/" + parts[0] + "/" + parts[1]};
  if (parts.size() >= 4 && (parts[2] == "tree" || parts[2] == "blob")) {
    parsed.ref = parts[3];
    for (std::size_t i = 4; i < parts.size(); ++i) {
      parsed.subpath += (parsed.subpath.empty() ? "" : "/") + parts[i];
    }
  }
  return common::Result<ParsedSource>::success(std::move(parsed));
}

common::Result<ParsedSource> parse_git_ssh(const std::string &input) {
  const std::string rest = input.substr(4);
  const auto colon = rest.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
    return common::Result<ParsedSource>::failure("invalid Git SSH URL format");
  }
  const std::string host = rest.substr(0, colon);
  const std::string repo_path = strip_git_suffix(rest.substr(colon + 1));

  SourceKind kind = SourceKind::GitUrl;
  if (host.find("github.com") != std::string::npos) {
    kind = SourceKind::GitHub;
  } else if (host.find("gitlab.com") != std::string::npos) {
    kind = SourceKind::GitLab;
  }
  return common::Result<ParsedSource>::success(
      ParsedSource{.kind = kind, .url = "https://" + host + "/" + repo_path});
}

common::Result<ParsedSource> parse_local(const std::string &input) {
  if (input.empty()) {
    return common::Result<ParsedSource>::failure("local path cannot be empty");
  }
  std::string path = std::filesystem::path(input).lexically_normal().string();
  if (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return common::Result<ParsedSource>::success(
      ParsedSource{.kind = SourceKind::Local, .local_path = path});
}

} // namespace

std::string normalize_url(const std::string &url) {
  std::string normalized = common::to_lower(common::trim(url));
  if (common::ends_with(normalized, "/")) {
    normalized.pop_back();
  }
  if (common::ends_with(normalized, ".git")) {
    normalized.resize(normalized.size() - 4);
  }
  return normalized;
}

std::string ParsedSource::clone_url() const {
  if (kind == SourceKind::Local) {
    return "";
  }
  const auto tree = url.find("/tree/");
  if (kind == SourceKind::GitHub && tree != std::string::npos) {
    return url.substr(0, tree);
  }
  return url;
}

common::Result<ParsedSource> parse_source(const std::string &raw) {
  const std::string input = common::trim(raw);
  if (input.empty()) {
    return common::Result<ParsedSource>::failure("source cannot be empty");
  }

  if (common::starts_with(input, "gh:")) {
    return parse_github_shorthand(input.substr(3));
  }
  if (common::starts_with(input, "local:")) {
    return parse_local(input.substr(6));
  }
  if (common::starts_with(input, "http://") || common::starts_with(input, "https://")) {
    if (std::regex_match(input, github_url_pattern())) {
      return parse_github_url(input);
    }
    const bool gitlab = common::starts_with(input, "https://gitlab.com/") ||
                        common::starts_with(input, "http://gitlab.com/");
    return common::Result<ParsedSource>::success(ParsedSource{
        .kind = gitlab ? SourceKind::GitLab : SourceKind::GitUrl,
        .url = gitlab ? strip_git_suffix(input) : input,
    });
  }
  if (common::starts_with(input, "file://")) {
    return common::Result<ParsedSource>::success(
        ParsedSource{.kind = SourceKind::GitUrl, .url = input});
  }
  if (common::starts_with(input, "git@")) {
    return parse_git_ssh(input);
  }
  if (std::regex_match(input, owner_repo_pattern())) {
    return parse_github_shorthand(input);
  }
  if (common::starts_with(input, "./") || common::starts_with(input, "../") ||
      std::filesystem::path(input).is_absolute() || input == "." || input == "..") {
    return parse_local(input);
  }
  return common::Result<ParsedSource>::failure("unable to parse source format: " + input);
}

} // namespace aimgr::source
