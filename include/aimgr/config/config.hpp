#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aimgr::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

struct RepoPathEnv {
  std::string repo_path;     // AIMGR_REPO_PATH
  std::string xdg_data_home; // XDG_DATA_HOME
  std::string home;          // HOME
};

[[nodiscard]] RepoPathEnv repo_path_env_from_process();

/// Resolution order: AIMGR_REPO_PATH, then repo.path from config, then
/// $XDG_DATA_HOME/ai-config/repo, then ~/.local/share/ai-config/repo.
[[nodiscard]] common::Result<std::filesystem::path> resolve_repo_path(const Config &config,
                                                                      const RepoPathEnv &env);

} // namespace aimgr::config
