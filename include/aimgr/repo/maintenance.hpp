#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/resource/types.hpp"
#include "aimgr/workspace/cache.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::repo {

enum class UpdateOutcome {
  Updated,
  Skipped,
  Failed,
};

struct UpdatedResource {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  UpdateOutcome outcome = UpdateOutcome::Failed;
  std::string message;
};

struct UpdateReport {
  std::vector<UpdatedResource> items;
  bool dry_run = false;

  [[nodiscard]] std::size_t count(UpdateOutcome outcome) const;
  /// "Summary: 2 updated, 0 failed, 1 skipped"
  [[nodiscard]] std::string summary() const;
};

struct UpdateOptions {
  bool dry_run = false;
};

/// Re-imports each resource from the source its metadata names, all resources when
/// `refs` is empty. A source that no longer resolves marks its resources skipped, not
/// failed.
[[nodiscard]] common::Result<UpdateReport>
update_resources(const Repository &repository, workspace::WorkspaceCache &cache,
                 const std::vector<resource::ResourceRef> &refs, const UpdateOptions &options);

struct PackageIssue {
  std::string name;
  std::vector<std::string> missing;
};

struct VerifyReport {
  std::vector<OrphanedFile> resources_without_metadata;
  std::vector<metadata::ResourceMetadata> orphaned_metadata;
  std::vector<metadata::ResourceMetadata> missing_source_paths;
  std::vector<PackageIssue> packages_with_missing_refs;
  bool fixed = false;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
};

struct VerifyOptions {
  bool fix = false;
};

/// With `fix`, missing metadata is created for resources on disk and metadata for
/// missing resources is deleted.
[[nodiscard]] common::Result<VerifyReport> verify_repository(const Repository &repository,
                                                             const VerifyOptions &options);

struct PruneReport {
  std::vector<workspace::CachedCheckout> unreferenced;
  std::size_t removed = 0;
  std::size_t failed = 0;
  std::uintmax_t freed_bytes = 0;
  bool dry_run = false;

  [[nodiscard]] std::uintmax_t total_bytes() const;
};

struct PruneOptions {
  bool dry_run = false;
};

/// Deletes workspace clones that neither a configured source nor any resource's
/// metadata refers to.
[[nodiscard]] common::Result<PruneReport> prune_workspace(const Repository &repository,
                                                          workspace::WorkspaceCache &cache,
                                                          const PruneOptions &options);

[[nodiscard]] std::string format_size(std::uintmax_t bytes);

} // namespace aimgr::repo
