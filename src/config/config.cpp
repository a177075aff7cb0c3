#include "aimgr/config/config.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/toml.hpp"
#include "aimgr/tools/tools.hpp"

#include <cstdlib>
#include <sstream>

namespace aimgr::config {

namespace {

constexpr const char *CONFIG_FOLDER = "aimgr";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("AIMGR_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string env_or_empty(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr) {
    return value;
  }
  return "";
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  if (const std::string xdg = env_or_empty("XDG_CONFIG_HOME"); !xdg.empty()) {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(xdg) /
                                                          CONFIG_FOLDER);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / ".config" / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *targets = std::getenv("AIMGR_INSTALL_TARGETS");
      targets != nullptr && *targets != '\0') {
    std::vector<std::string> parsed;
    for (const auto &part : common::split(targets, ',')) {
      const std::string target = common::trim(part);
      if (!target.empty()) {
        parsed.push_back(target);
      }
    }
    config.install.targets = std::move(parsed);
  }

  if (const char *backend = std::getenv("AIMGR_LOG"); backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("unable to open config file: " + path.string());
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure("parsing config file " + path.string() + ": " +
                                           parsed.error());
  }

  const auto &doc = parsed.value();
  config.repo.path = expand_config_value(doc.get_string("repo.path", config.repo.path));
  config.install.targets = doc.get_string_array("install.targets", config.install.targets);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "[repo]\n";
  file << "path = " << common::quote_toml_string(config.repo.path) << "\n";

  file << "\n[install]\n";
  file << "targets = " << common::toml_string_array(config.install.targets) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.install.targets.empty()) {
    warnings.push_back("install.targets is empty; installs need an explicit --target");
  }
  for (const auto &target : config.install.targets) {
    if (!tools::parse_tool(target).has_value()) {
      return common::Result<std::vector<std::string>>::failure(
          "invalid install.targets entry '" + target + "' (valid: " +
          tools::valid_tool_names() + ")");
    }
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  for (const auto &part : common::split(backend, ',')) {
    const std::string p = common::trim(part);
    if (!p.empty() && p != "log" && p != "none" && p != "noop") {
      warnings.push_back("unknown observability.backend '" + p + "', falling back to log");
    }
  }

  if (!config.repo.path.empty() && std::filesystem::path(config.repo.path).is_relative()) {
    warnings.push_back("repo.path is relative and resolves against the working directory");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

RepoPathEnv repo_path_env_from_process() {
  return RepoPathEnv{.repo_path = env_or_empty("AIMGR_REPO_PATH"),
                     .xdg_data_home = env_or_empty("XDG_DATA_HOME"),
                     .home = env_or_empty("HOME")};
}

common::Result<std::filesystem::path> resolve_repo_path(const Config &config,
                                                        const RepoPathEnv &env) {
  if (!common::trim(env.repo_path).empty()) {
    return common::Result<std::filesystem::path>::success(
        common::absolute_path(common::expand_path(common::trim(env.repo_path))));
  }
  if (!common::trim(config.repo.path).empty()) {
    return common::Result<std::filesystem::path>::success(
        common::absolute_path(common::expand_path(common::trim(config.repo.path))));
  }
  if (!common::trim(env.xdg_data_home).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(env.xdg_data_home) / "ai-config" / "repo");
  }
  if (!common::trim(env.home).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(env.home) / ".local" / "share" / "ai-config" / "repo");
  }
  return common::Result<std::filesystem::path>::failure(
      "unable to resolve repository path: set AIMGR_REPO_PATH or HOME");
}

} // namespace aimgr::config
