#include "aimgr/install/installer.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/resource/kind.hpp"

#include <algorithm>
#include <map>

namespace aimgr::install {

namespace {

using resource::ResourceType;

std::string type_name(const ResourceType type) {
  return std::string(resource::resource_type_to_string(type));
}

bool is_link(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

bool target_exists(const std::filesystem::path &link) {
  std::error_code ec;
  return std::filesystem::exists(link, ec);
}

std::filesystem::path link_target(const std::filesystem::path &link) {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(link, ec);
  if (ec) {
    return link;
  }
  if (target.is_relative()) {
    target = link.parent_path() / target;
  }
  return target.lexically_normal();
}

struct FoundLink {
  std::filesystem::path link;
  std::filesystem::path relative;
};

// Symlinks directly in `dir`, plus one nesting level for file resources.
std::vector<FoundLink> find_links(const std::filesystem::path &dir, const ResourceType type) {
  std::vector<FoundLink> links;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return links;
  }
  const bool files = type != ResourceType::Skill;
  const auto accept = [&](const std::filesystem::path &path) {
    return !files || path.extension() == ".md";
  };

  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &path = it->path();
    if (is_link(path)) {
      if (accept(path)) {
        links.push_back(FoundLink{.link = path, .relative = path.lexically_relative(dir)});
      }
      continue;
    }
    std::error_code dir_ec;
    if (!files || !std::filesystem::is_directory(path, dir_ec)) {
      continue;
    }
    for (std::filesystem::directory_iterator nested(path, dir_ec), nested_end;
         !dir_ec && nested != nested_end; nested.increment(dir_ec)) {
      if (is_link(nested->path()) && accept(nested->path())) {
        links.push_back(FoundLink{.link = nested->path(),
                                  .relative = nested->path().lexically_relative(dir)});
      }
    }
  }
  std::sort(links.begin(), links.end(),
            [](const FoundLink &a, const FoundLink &b) { return a.link < b.link; });
  return links;
}

std::string tool_list(const std::vector<tools::Tool> &targets) {
  std::string joined;
  for (const auto tool : targets) {
    joined += (joined.empty() ? "" : ", ") + std::string(tools::tool_name(tool));
  }
  return joined;
}

} // namespace

std::string_view health_to_string(const Health health) {
  return health == Health::Ok ? "ok" : "broken";
}

Installer::Installer(std::filesystem::path project, std::vector<tools::Tool> targets)
    : project_(common::absolute_path(project)), targets_(std::move(targets)) {}

common::Result<Installer> Installer::for_project(const std::filesystem::path &project,
                                                 const std::vector<tools::Tool> &explicit_targets,
                                                 const std::vector<tools::Tool> &defaults) {
  auto manifest_targets = tools::read_project_targets(project);
  if (!manifest_targets.ok()) {
    return common::Result<Installer>::failure("invalid install.targets in " +
                                              std::string(tools::PROJECT_MANIFEST_FILE) + ": " +
                                              manifest_targets.error());
  }
  auto targets = tools::resolve_targets(explicit_targets, tools::detect_existing_tools(project),
                                        manifest_targets.value(), defaults);
  if (targets.empty()) {
    return common::Result<Installer>::failure("no install targets configured");
  }
  return common::Result<Installer>::success(Installer(project, std::move(targets)));
}

std::filesystem::path Installer::link_path(const tools::Tool tool, const std::string &name,
                                           const ResourceType type) const {
  const auto info = tools::tool_info(tool);
  return project_ / info.dir_for(type) / resource::kind_for(type).link_name(name);
}

common::Result<InstallReport> Installer::install(const repo::Repository &repository,
                                                 const std::string &name,
                                                 const ResourceType type) const {
  if (type == ResourceType::Package) {
    return install_package(repository, name);
  }

  auto stored = repository.get(name, type);
  if (!stored.ok()) {
    return common::Result<InstallReport>::failure(stored.error());
  }
  const auto target = repository.resource_path(name, type);
  const std::string id = type_name(type) + "/" + name;

  InstallReport report;
  bool supported = false;
  for (const auto tool : targets_) {
    if (!tools::tool_info(tool).supports(type)) {
      continue;
    }
    supported = true;

    const auto link = link_path(tool, name, type);
    auto created = common::ensure_dir(link.parent_path());
    if (!created.ok()) {
      return common::Result<InstallReport>::failure("failed to create directory for " +
                                                    std::string(tools::tool_name(tool)) + ": " +
                                                    created.error());
    }

    std::error_code ec;
    if (common::entry_exists(link)) {
      if (!is_link(link) || target_exists(link)) {
        report.already_present.push_back(tool);
        continue;
      }
      std::filesystem::remove(link, ec);
      if (ec) {
        return common::Result<InstallReport>::failure("failed to remove broken symlink " +
                                                      link.string() + ": " + ec.message());
      }
    }

    if (type == ResourceType::Skill) {
      std::filesystem::create_directory_symlink(target, link, ec);
    } else {
      std::filesystem::create_symlink(target, link, ec);
    }
    if (ec) {
      observability::record_install(std::string(tools::tool_name(tool)), id, "install", false);
      return common::Result<InstallReport>::failure("failed to create symlink for " +
                                                    std::string(tools::tool_name(tool)) + ": " +
                                                    ec.message());
    }
    observability::record_install(std::string(tools::tool_name(tool)), id, "install", true);
    report.linked.push_back(tool);
  }

  if (!supported) {
    return common::Result<InstallReport>::failure("none of the target tools (" +
                                                  tool_list(targets_) + ") support " +
                                                  resource::resource_type_dir(type));
  }
  return common::Result<InstallReport>::success(std::move(report));
}

common::Result<InstallReport> Installer::install_package(const repo::Repository &repository,
                                                         const std::string &name) const {
  auto package = repository.get(name, ResourceType::Package);
  if (!package.ok()) {
    return common::Result<InstallReport>::failure(package.error());
  }

  InstallReport report;
  report.missing = repository.missing_package_references(package.value());
  for (const auto &reference : package.value().references) {
    if (std::find(report.missing.begin(), report.missing.end(), reference) !=
        report.missing.end()) {
      continue;
    }
    auto ref = resource::parse_resource_reference(reference);
    if (!ref.ok()) {
      report.missing.push_back(reference);
      continue;
    }
    auto installed = install(repository, ref.value().name, ref.value().type);
    if (!installed.ok()) {
      observability::record_warning("install", "package '" + name + "': " + installed.error());
      continue;
    }
    for (const auto tool : installed.value().linked) {
      if (std::find(report.linked.begin(), report.linked.end(), tool) == report.linked.end()) {
        report.linked.push_back(tool);
      }
    }
    for (const auto tool : installed.value().already_present) {
      if (std::find(report.already_present.begin(), report.already_present.end(), tool) ==
          report.already_present.end()) {
        report.already_present.push_back(tool);
      }
    }
  }
  return common::Result<InstallReport>::success(std::move(report));
}

common::Result<UninstallReport> Installer::uninstall(const repo::Repository &repository,
                                                     const std::string &name,
                                                     const ResourceType type) const {
  if (type == ResourceType::Package) {
    return uninstall_package(repository, name);
  }

  const std::string id = type_name(type) + "/" + name;
  UninstallReport report;
  std::string last_error;
  for (const auto tool : targets_) {
    if (!tools::tool_info(tool).supports(type)) {
      continue;
    }
    const auto link = link_path(tool, name, type);
    if (!common::entry_exists(link)) {
      continue;
    }
    if (!is_link(link)) {
      last_error = "'" + name + "' in " + std::string(tools::tool_name(tool)) +
                   " is not a symlink (manual installation?)";
      report.warnings.push_back(last_error);
      continue;
    }
    std::error_code ec;
    std::filesystem::remove(link, ec);
    if (ec) {
      last_error = "failed to remove symlink from " + std::string(tools::tool_name(tool)) + ": " +
                   ec.message();
      report.warnings.push_back(last_error);
      observability::record_install(std::string(tools::tool_name(tool)), id, "uninstall", false);
      continue;
    }
    observability::record_install(std::string(tools::tool_name(tool)), id, "uninstall", true);
    report.removed.push_back(tool);
  }

  if (report.removed.empty()) {
    return common::Result<UninstallReport>::failure(
        last_error.empty() ? "resource '" + name + "' is not installed" : last_error);
  }
  return common::Result<UninstallReport>::success(std::move(report));
}

common::Result<UninstallReport> Installer::uninstall_package(const repo::Repository &repository,
                                                             const std::string &name) const {
  auto package = repository.get(name, ResourceType::Package);
  if (!package.ok()) {
    return common::Result<UninstallReport>::failure(package.error());
  }

  UninstallReport report;
  for (const auto &reference : package.value().references) {
    auto ref = resource::parse_resource_reference(reference);
    if (!ref.ok()) {
      report.warnings.push_back(ref.error());
      continue;
    }
    auto removed = uninstall(repository, ref.value().name, ref.value().type);
    if (!removed.ok()) {
      report.warnings.push_back(reference + ": " + removed.error());
      continue;
    }
    for (const auto tool : removed.value().removed) {
      if (std::find(report.removed.begin(), report.removed.end(), tool) == report.removed.end()) {
        report.removed.push_back(tool);
      }
    }
  }
  if (report.removed.empty()) {
    return common::Result<UninstallReport>::failure("package '" + name + "' is not installed");
  }
  return common::Result<UninstallReport>::success(std::move(report));
}

std::vector<InstalledResource> Installer::list() const {
  std::vector<InstalledResource> resources;
  std::map<std::pair<ResourceType, std::string>, std::size_t> index;

  for (const auto tool : targets_) {
    const auto info = tools::tool_info(tool);
    for (const auto type : {ResourceType::Command, ResourceType::Skill, ResourceType::Agent}) {
      if (!info.supports(type)) {
        continue;
      }
      const auto &kind = resource::kind_for(type);
      for (const auto &found : find_links(project_ / info.dir_for(type), type)) {
        InstalledResource entry{
            .type = type,
            .name = kind.name_from_link(found.relative),
            .path = link_target(found.link),
        };
        if (!target_exists(found.link)) {
          entry.health = Health::Broken;
        } else {
          auto loaded = kind.load(entry.path);
          if (!loaded.ok()) {
            observability::record_warning("install", "skipping unreadable link " +
                                                         found.link.string() + ": " +
                                                         loaded.error());
            continue;
          }
          entry.description = loaded.value().description;
        }

        const auto key = std::make_pair(type, entry.name);
        const auto existing = index.find(key);
        if (existing == index.end()) {
          entry.tools.push_back(tool);
          index.emplace(key, resources.size());
          resources.push_back(std::move(entry));
          continue;
        }
        auto &merged = resources[existing->second];
        if (std::find(merged.tools.begin(), merged.tools.end(), tool) == merged.tools.end()) {
          merged.tools.push_back(tool);
        }
        if (merged.health == Health::Broken && entry.health == Health::Ok) {
          merged.health = Health::Ok;
          merged.path = entry.path;
          merged.description = entry.description;
        }
      }
    }
  }

  std::sort(resources.begin(), resources.end(),
            [](const InstalledResource &a, const InstalledResource &b) {
              if (a.type != b.type) {
                return a.type < b.type;
              }
              return a.name < b.name;
            });
  return resources;
}

bool Installer::is_installed(const std::string &name, const ResourceType type) const {
  for (const auto tool : targets_) {
    if (!tools::tool_info(tool).supports(type)) {
      continue;
    }
    const auto link = link_path(tool, name, type);
    if (is_link(link) && target_exists(link)) {
      return true;
    }
  }
  return false;
}

} // namespace aimgr::install
