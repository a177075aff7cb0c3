#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/resource/kind.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aimgr::repo {

struct OrphanedFile {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  std::filesystem::path path;
};

struct OrphanReport {
  std::vector<OrphanedFile> files;
  std::vector<metadata::ResourceMetadata> metadata;

  [[nodiscard]] bool empty() const { return files.empty() && metadata.empty(); }
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  /// Creates the store layout, the git repository, an empty ai.repo.yaml and a
  /// .gitignore for the workspace cache. Safe to run on an existing repository.
  [[nodiscard]] common::Status init() const;
  [[nodiscard]] bool is_initialized() const;
  [[nodiscard]] bool is_git_repo() const;

  [[nodiscard]] std::filesystem::path resource_path(const std::string &name,
                                                    resource::ResourceType type) const;
  [[nodiscard]] bool resource_exists(const std::string &name, resource::ResourceType type) const;

  /// Loadable resources of `type`, or of every type, sorted by type then name. Both
  /// orphan classes are reported through the observer; orphaned files are still
  /// listed.
  [[nodiscard]] common::Result<std::vector<resource::Resource>>
  list(std::optional<resource::ResourceType> type = std::nullopt) const;
  [[nodiscard]] OrphanReport
  find_orphans(std::optional<resource::ResourceType> type = std::nullopt) const;

  [[nodiscard]] common::Result<resource::Resource> get(const std::string &name,
                                                       resource::ResourceType type) const;
  /// Deletes whichever of the resource and its metadata exist; "not found" only when
  /// neither does.
  [[nodiscard]] common::Status remove(const std::string &name, resource::ResourceType type) const;

  [[nodiscard]] common::Result<metadata::ResourceMetadata>
  metadata(const std::string &name, resource::ResourceType type) const;
  [[nodiscard]] bool has_source(const std::string &name, resource::ResourceType type,
                                const std::string &id_or_name) const;

  [[nodiscard]] std::vector<std::string>
  missing_package_references(const resource::Resource &package) const;

  [[nodiscard]] common::Status commit_changes(const std::string &message) const;

private:
  std::filesystem::path root_;
};

void commit_best_effort(const Repository &repository, const std::string &message);

} // namespace aimgr::repo
