#pragma once

#include <string>
#include <vector>

namespace aimgr::config {

struct RepoConfig {
  std::string path;
};

struct InstallConfig {
  std::vector<std::string> targets = {"claude"};
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  RepoConfig repo;
  InstallConfig install;
  ObservabilityConfig observability;
};

} // namespace aimgr::config
