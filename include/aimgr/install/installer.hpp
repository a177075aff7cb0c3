#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/resource/types.hpp"
#include "aimgr/tools/tools.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace aimgr::install {

enum class Health {
  Ok,
  Broken,
};

[[nodiscard]] std::string_view health_to_string(Health health);

struct InstalledResource {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  std::string description;
  std::filesystem::path path;
  Health health = Health::Ok;
  std::vector<tools::Tool> tools;
};

struct InstallReport {
  std::vector<tools::Tool> linked;
  std::vector<tools::Tool> already_present;
  std::vector<std::string> missing;
};

struct UninstallReport {
  std::vector<tools::Tool> removed;
  std::vector<std::string> warnings;
};

class Installer {
public:
  Installer(std::filesystem::path project, std::vector<tools::Tool> targets);

  /// Resolves targets by precedence: `explicit_targets`, tool directories already in
  /// the project, ai.package.yaml, then `defaults`.
  [[nodiscard]] static common::Result<Installer>
  for_project(const std::filesystem::path &project, const std::vector<tools::Tool> &explicit_targets,
              const std::vector<tools::Tool> &defaults);

  [[nodiscard]] const std::filesystem::path &project() const { return project_; }
  [[nodiscard]] const std::vector<tools::Tool> &targets() const { return targets_; }

  /// Symlinks the resource into every target tool that supports its type. Existing
  /// entries are left alone; dangling links are replaced. Packages install each
  /// referenced resource found in the repository.
  [[nodiscard]] common::Result<InstallReport> install(const repo::Repository &repository,
                                                      const std::string &name,
                                                      resource::ResourceType type) const;

  [[nodiscard]] common::Result<UninstallReport> uninstall(const repo::Repository &repository,
                                                          const std::string &name,
                                                          resource::ResourceType type) const;

  [[nodiscard]] std::vector<InstalledResource> list() const;

  [[nodiscard]] bool is_installed(const std::string &name, resource::ResourceType type) const;

  [[nodiscard]] std::filesystem::path link_path(tools::Tool tool, const std::string &name,
                                                resource::ResourceType type) const;

private:
  [[nodiscard]] common::Result<InstallReport>
  install_package(const repo::Repository &repository, const std::string &name) const;
  [[nodiscard]] common::Result<UninstallReport>
  uninstall_package(const repo::Repository &repository, const std::string &name) const;

  std::filesystem::path project_;
  std::vector<tools::Tool> targets_;
};

} // namespace aimgr::install
