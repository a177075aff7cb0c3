#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/repo/importer.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/workspace/cache.hpp"

#include <string>
#include <vector>

namespace aimgr::repo {

struct SyncOptions {
  bool skip_existing = false;
  bool dry_run = false;
};

struct RemovedResource {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  std::string source_name;
};

struct SourceSyncReport {
  std::string name;
  std::string id;
  bool success = false;
  std::string error;
  ImportResult import;
};

struct SyncReport {
  std::vector<SourceSyncReport> sources;
  std::vector<RemovedResource> removed;
  bool dry_run = false;
  common::Status status = common::Status::success();

  [[nodiscard]] std::size_t synced_count() const;
  [[nodiscard]] std::size_t failed_count() const;
  [[nodiscard]] std::string summary() const;
};

/// Re-imports every configured source in manifest order and removes resources that
/// disappeared from their source. A source that cannot be resolved is reported and
/// skipped; the sync fails only when there are no sources or all of them fail.
class SyncReconciler {
public:
  SyncReconciler(const Repository &repository, workspace::WorkspaceCache &cache);

  [[nodiscard]] SyncReport sync(const SyncOptions &options);

private:
  const Repository &repository_;
  workspace::WorkspaceCache &cache_;
};

} // namespace aimgr::repo
