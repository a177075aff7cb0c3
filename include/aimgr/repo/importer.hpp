#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/discovery/discovery.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/resource/kind.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace aimgr::repo {

/// Conflict policy and provenance for one import batch. `force` and `skip_existing`
/// are exclusive; `dry_run` composes with either.
struct ImportOptions {
  bool force = false;
  bool skip_existing = false;
  bool dry_run = false;

  std::string source_name;
  std::string source_id;
  std::string source_url;
  std::string source_type;
  std::string ref;
  resource::ImportMode mode = resource::ImportMode::Copy;

  bool commit = true;
};

struct ImportedItem {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  std::filesystem::path source_path;
};

struct ImportFailure {
  std::filesystem::path source_path;
  std::string message;
  bool conflict = false;
};

/// Outcome of a batch. Overwrites count as added and are also listed in `updated`.
struct ImportResult {
  std::vector<ImportedItem> added;
  std::vector<ImportedItem> updated;
  std::vector<ImportedItem> skipped;
  std::vector<ImportFailure> failed;

  std::size_t command_count = 0;
  std::size_t skill_count = 0;
  std::size_t agent_count = 0;
  std::size_t package_count = 0;

  [[nodiscard]] common::Status status() const;
  [[nodiscard]] std::string summary() const;
};

class BulkImporter {
public:
  explicit BulkImporter(const Repository &repository);

  /// Imports discovered candidates as the type discovery assigned them. Failures are
  /// collected per candidate; the batch never stops early.
  [[nodiscard]] ImportResult import_candidates(const std::vector<discovery::Candidate> &candidates,
                                               const ImportOptions &options) const;

  [[nodiscard]] ImportResult import_paths(const std::vector<std::filesystem::path> &paths,
                                          const ImportOptions &options) const;

private:
  [[nodiscard]] ImportResult
  import_batch(const std::vector<std::filesystem::path> &paths,
               const std::vector<std::optional<resource::ResourceType>> &types,
               const ImportOptions &options) const;
  void import_one(const std::filesystem::path &path, std::optional<resource::ResourceType> type,
                  const ImportOptions &options, ImportResult &result,
                  std::set<std::filesystem::path> &batch_targets) const;

  const Repository &repository_;
};

} // namespace aimgr::repo
