#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "aimgr/config/config.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    if (next.has_value()) {
      aimgr::config::set_config_path_override(*next);
    } else {
      aimgr::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() { aimgr::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  using aimgr::testing::EnvGuard;
  using aimgr::testing::TempWorkspace;
  namespace cfg = aimgr::config;

  tests.push_back({"config_path_defaults_under_home", [] {
                     TempWorkspace ws;
                     const EnvGuard home("HOME", ws.path().string());
                     const EnvGuard xdg("XDG_CONFIG_HOME", std::nullopt);
                     const EnvGuard env_path("AIMGR_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard guard;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == ws.path() / ".config" / "aimgr" / "config.toml",
                             path.value().string());
                   }});

  tests.push_back({"config_path_env_override", [] {
                     TempWorkspace ws;
                     const EnvGuard env_path("AIMGR_CONFIG_PATH",
                                             (ws.path() / "custom.toml").string());
                     const ConfigOverrideGuard guard;
                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == ws.path() / "custom.toml",
                             "AIMGR_CONFIG_PATH should win");
                   }});

  tests.push_back({"config_missing_file_returns_defaults", [] {
                     TempWorkspace ws;
                     const EnvGuard targets("AIMGR_INSTALL_TARGETS", std::nullopt);
                     const EnvGuard log("AIMGR_LOG", std::nullopt);
                     const ConfigOverrideGuard guard(ws.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().install.targets.size() == 1 &&
                                 loaded.value().install.targets[0] == "claude",
                             "default target is claude");
                     require(loaded.value().observability.backend == "none",
                             "default backend is none");
                     require(loaded.value().repo.path.empty(), "no repo path by default");
                   }});

  tests.push_back({"config_load_valid_toml_expands_values", [] {
                     TempWorkspace ws;
                     const EnvGuard targets("AIMGR_INSTALL_TARGETS", std::nullopt);
                     const EnvGuard log("AIMGR_LOG", std::nullopt);
                     const EnvGuard root("AIMGR_TEST_ROOT", ws.path().string());
                     const ConfigOverrideGuard guard(ws.path() / "config.toml");
                     ws.create_file("config.toml", R"(
[repo]
path = "${AIMGR_TEST_ROOT}/repo"

[install]
targets = ["claude", "opencode"]

[observability]
backend = "log"
)");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().repo.path == (ws.path() / "repo").string(),
                             "repo.path should expand: " + loaded.value().repo.path);
                     require(loaded.value().install.targets.size() == 2, "two targets");
                     require(loaded.value().observability.backend == "log", "backend");
                   }});

  tests.push_back({"config_env_overrides_targets", [] {
                     TempWorkspace ws;
                     const EnvGuard targets("AIMGR_INSTALL_TARGETS", "opencode, copilot");
                     const ConfigOverrideGuard guard(ws.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().install.targets.size() == 2 &&
                                 loaded.value().install.targets[1] == "copilot",
                             "env targets should replace defaults");
                   }});

  tests.push_back({"config_save_and_reload_round_trip", [] {
                     TempWorkspace ws;
                     const EnvGuard targets("AIMGR_INSTALL_TARGETS", std::nullopt);
                     const EnvGuard log("AIMGR_LOG", std::nullopt);
                     const ConfigOverrideGuard guard(ws.path() / "config.toml");
                     cfg::Config config;
                     config.repo.path = "/srv/ai";
                     config.install.targets = {"copilot"};
                     require(cfg::save_config(config).ok(), "save should succeed");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().repo.path == "/srv/ai", "repo path persisted");
                     require(loaded.value().install.targets ==
                                 std::vector<std::string>{"copilot"},
                             "targets persisted");
                   }});

  tests.push_back({"config_validate_rejects_unknown_target", [] {
                     cfg::Config config;
                     config.install.targets = {"claude", "emacs"};
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "unknown target should be an error");
                     require(result.error().find("emacs") != std::string::npos, result.error());
                   }});

  tests.push_back({"config_validate_warns_on_empty_targets", [] {
                     cfg::Config config;
                     config.install.targets.clear();
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(!result.value().empty(), "empty targets should warn");
                   }});

  tests.push_back({"config_resolve_repo_path_precedence", [] {
                     cfg::Config config;
                     cfg::RepoPathEnv env{.repo_path = "/env/repo",
                                          .xdg_data_home = "/xdg",
                                          .home = "/home/u"};
                     config.repo.path = "/config/repo";

                     auto path = cfg::resolve_repo_path(config, env);
                     require(path.ok() && path.value() == "/env/repo", "env wins");

                     env.repo_path.clear();
                     path = cfg::resolve_repo_path(config, env);
                     require(path.ok() && path.value() == "/config/repo", "config second");

                     config.repo.path.clear();
                     path = cfg::resolve_repo_path(config, env);
                     require(path.ok() && path.value() == "/xdg/ai-config/repo", "xdg third");

                     env.xdg_data_home.clear();
                     path = cfg::resolve_repo_path(config, env);
                     require(path.ok() && path.value() == "/home/u/.local/share/ai-config/repo",
                             "home last");

                     env.home.clear();
                     require(!cfg::resolve_repo_path(config, env).ok(),
                             "nothing to resolve from");
                   }});
}
