#include "aimgr/repo/repository.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/process.hpp"
#include "aimgr/manifest/manifest.hpp"
#include "aimgr/observability/global.hpp"

#include <algorithm>

namespace aimgr::repo {

namespace {

constexpr const char *WORKSPACE_IGNORE = ".workspace/";

std::vector<resource::ResourceType> selected_types(std::optional<resource::ResourceType> type) {
  if (type.has_value()) {
    return {*type};
  }
  return {resource::ALL_RESOURCE_TYPES.begin(), resource::ALL_RESOURCE_TYPES.end()};
}

common::Status ensure_gitignore(const std::filesystem::path &root) {
  const auto path = root / ".gitignore";
  std::string content;
  if (common::entry_exists(path)) {
    auto existing = common::read_file(path);
    if (!existing.ok()) {
      return common::Status::error(existing.error());
    }
    content = existing.value();
    for (const auto &line : common::split(content, '\n')) {
      const std::string entry = common::trim(line);
      if (entry == WORKSPACE_IGNORE || entry == ".workspace") {
        return common::Status::success();
      }
    }
    if (!content.empty() && content.back() != '\n') {
      content += "\n";
    }
  } else {
    content = "# aimgr workspace cache\n";
  }
  content += std::string(WORKSPACE_IGNORE) + "\n";
  return common::write_file(path, content);
}

// Removes empty directories between `path` and `stop`, exclusive.
void prune_empty_parents(std::filesystem::path path, const std::filesystem::path &stop) {
  std::error_code ec;
  while (path != stop && common::is_subpath(path, stop) &&
         std::filesystem::is_directory(path, ec) && std::filesystem::is_empty(path, ec)) {
    std::filesystem::remove(path, ec);
    path = path.parent_path();
  }
}

} // namespace

Repository::Repository(std::filesystem::path root) : root_(common::absolute_path(root)) {}

bool Repository::is_git_repo() const {
  std::error_code ec;
  return std::filesystem::is_directory(root_ / ".git", ec);
}

bool Repository::is_initialized() const {
  std::error_code ec;
  return std::filesystem::is_directory(root_, ec) &&
         std::filesystem::exists(root_ / manifest::MANIFEST_FILE, ec);
}

common::Status Repository::init() const {
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    auto created = common::ensure_dir(root_ / resource::resource_type_dir(type));
    if (!created.ok()) {
      return common::Status::error("failed to create repository layout: " + created.error());
    }
  }

  const bool fresh = !is_git_repo();
  if (fresh) {
    if (!common::command_exists("git")) {
      observability::record_warning("repo", "git not found; repository is not versioned");
    } else {
      auto initialized = common::run_git(root_, {"init"});
      if (!initialized.ok()) {
        return common::Status::error("failed to initialize git repository: " +
                                     initialized.error());
      }
    }
  }

  const auto manifest_path = root_ / manifest::MANIFEST_FILE;
  if (!common::entry_exists(manifest_path)) {
    auto saved = manifest::Manifest{}.save(root_);
    if (!saved.ok()) {
      return saved;
    }
  }

  auto ignored = ensure_gitignore(root_);
  if (!ignored.ok()) {
    return common::Status::error("failed to write .gitignore: " + ignored.error());
  }

  if (fresh && is_git_repo()) {
    commit_best_effort(*this, "aimgr: initialize repository");
  }
  return common::Status::success();
}

std::filesystem::path Repository::resource_path(const std::string &name,
                                                const resource::ResourceType type) const {
  return resource::kind_for(type).store_path(root_, name);
}

bool Repository::resource_exists(const std::string &name,
                                 const resource::ResourceType type) const {
  return common::entry_exists(resource_path(name, type));
}

common::Result<std::vector<resource::Resource>>
Repository::list(const std::optional<resource::ResourceType> type) const {
  std::vector<resource::Resource> resources;
  for (const auto current : selected_types(type)) {
    const auto &kind = resource::kind_for(current);
    for (const auto &entry : kind.scan(root_)) {
      auto loaded = kind.load(entry.path);
      if (!loaded.ok()) {
        const std::string kind_name(resource::resource_type_to_string(current));
        observability::record_warning("repo", "skipping unreadable " + kind_name + " '" +
                                                  entry.name + "': " + loaded.error());
        continue;
      }
      resource::Resource item = std::move(loaded.value());
      item.name = entry.name;
      resources.push_back(std::move(item));
    }
  }

  const auto orphans = find_orphans(type);
  for (const auto &file : orphans.files) {
    observability::record_orphan("file", std::string(resource::resource_type_to_string(file.type)),
                                 file.name, file.path.string());
  }
  for (const auto &record : orphans.metadata) {
    observability::record_orphan(
        "metadata", std::string(resource::resource_type_to_string(record.type)), record.name,
        metadata::metadata_path(root_, record.name, record.type).string());
  }

  std::stable_sort(resources.begin(), resources.end(),
                   [](const resource::Resource &a, const resource::Resource &b) {
                     if (a.type != b.type) {
                       return a.type < b.type;
                     }
                     return a.name < b.name;
                   });
  return common::Result<std::vector<resource::Resource>>::success(std::move(resources));
}

OrphanReport Repository::find_orphans(const std::optional<resource::ResourceType> type) const {
  OrphanReport report;
  for (const auto current : selected_types(type)) {
    for (const auto &entry : resource::kind_for(current).scan(root_)) {
      if (!metadata::exists(root_, entry.name, current)) {
        report.files.push_back(
            OrphanedFile{.type = current, .name = entry.name, .path = entry.path});
      }
    }
    for (auto &record : metadata::list(root_, current)) {
      if (!resource_exists(record.name, current)) {
        report.metadata.push_back(std::move(record));
      }
    }
  }
  return report;
}

common::Result<resource::Resource> Repository::get(const std::string &name,
                                                   const resource::ResourceType type) const {
  const auto path = resource_path(name, type);
  if (!common::entry_exists(path)) {
    return common::Result<resource::Resource>::failure(
        std::string(resource::resource_type_to_string(type)) + " '" + name + "' not found");
  }
  auto loaded = resource::kind_for(type).load(path);
  if (!loaded.ok()) {
    return loaded;
  }
  loaded.value().name = name;
  return loaded;
}

common::Status Repository::remove(const std::string &name,
                                  const resource::ResourceType type) const {
  const auto path = resource_path(name, type);
  const bool has_file = common::entry_exists(path);
  const bool has_metadata = metadata::exists(root_, name, type);
  if (!has_file && !has_metadata) {
    return common::Status::error(std::string(resource::resource_type_to_string(type)) + " '" +
                                 name + "' not found");
  }

  if (has_file) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (std::filesystem::is_symlink(status) || !std::filesystem::is_directory(status)) {
      std::filesystem::remove(path, ec);
    } else {
      std::filesystem::remove_all(path, ec);
    }
    if (ec) {
      return common::Status::error("failed to remove " + path.string() + ": " + ec.message());
    }
    prune_empty_parents(path.parent_path(), root_ / resource::resource_type_dir(type));
  }

  if (has_metadata) {
    auto removed = metadata::remove(root_, name, type);
    if (!removed.ok()) {
      return removed;
    }
  }
  return common::Status::success();
}

common::Result<metadata::ResourceMetadata>
Repository::metadata(const std::string &name, const resource::ResourceType type) const {
  return metadata::load(root_, name, type);
}

bool Repository::has_source(const std::string &name, const resource::ResourceType type,
                            const std::string &id_or_name) const {
  auto record = metadata(name, type);
  return record.ok() && record.value().has_source(id_or_name);
}

std::vector<std::string>
Repository::missing_package_references(const resource::Resource &package) const {
  std::vector<std::string> missing;
  for (const auto &reference : package.references) {
    auto parsed = resource::parse_resource_reference(reference);
    if (!parsed.ok() || !resource_exists(parsed.value().name, parsed.value().type)) {
      missing.push_back(reference);
    }
  }
  return missing;
}

common::Status Repository::commit_changes(const std::string &message) const {
  if (!is_git_repo()) {
    return common::Status::success();
  }
  auto added = common::run_git(root_, {"add", "."});
  if (!added.ok()) {
    return common::Status::error("failed to stage changes: " + added.error());
  }
  auto status = common::run_git(root_, {"status", "--porcelain"});
  if (!status.ok()) {
    return common::Status::error("failed to check git status: " + status.error());
  }
  if (common::trim(status.value()).empty()) {
    return common::Status::success();
  }
  auto committed = common::run_git(root_, {"commit", "-m", message});
  if (!committed.ok()) {
    return common::Status::error("failed to commit changes: " + committed.error());
  }
  return common::Status::success();
}

void commit_best_effort(const Repository &repository, const std::string &message) {
  auto committed = repository.commit_changes(message);
  if (!committed.ok()) {
    observability::record_warning("repo", committed.error());
  }
}

} // namespace aimgr::repo
