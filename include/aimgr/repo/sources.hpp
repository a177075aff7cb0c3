#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/discovery/discovery.hpp"
#include "aimgr/manifest/manifest.hpp"
#include "aimgr/manifest/source_state.hpp"
#include "aimgr/repo/importer.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/workspace/cache.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::repo {

/// Local directory holding a source's resources: the path itself, or a workspace
/// checkout of the URL at its ref. The subpath is applied in both cases. Errors start
/// with "source unavailable:".
[[nodiscard]] common::Result<std::filesystem::path>
resolve_source_dir(const manifest::Source &source, workspace::WorkspaceCache &cache,
                   bool refresh = false);

[[nodiscard]] ImportOptions import_options_for(const manifest::Source &source);

struct AddSourceOptions {
  std::string name;
  bool force = false;
  bool skip_existing = false;
  bool dry_run = false;
};

struct AddSourceReport {
  manifest::Source source;
  std::filesystem::path resolved_dir;
  discovery::DiscoveredResources discovered;
  ImportResult import;
};

[[nodiscard]] common::Result<AddSourceReport> add_source(const Repository &repository,
                                                         workspace::WorkspaceCache &cache,
                                                         const std::string &input,
                                                         const AddSourceOptions &options);

struct RemoveSourceOptions {
  bool dry_run = false;
  bool keep_resources = false;
};

struct RemoveSourceReport {
  manifest::Source source;
  std::vector<resource::ResourceRef> removed;
  std::vector<std::string> failed;
};

/// Unregisters the source found by name, path or URL and removes every resource
/// whose metadata attributes it to that source.
[[nodiscard]] common::Result<RemoveSourceReport> remove_source(const Repository &repository,
                                                               const std::string &key,
                                                               const RemoveSourceOptions &options);

struct SourceListing {
  manifest::Source source;
  manifest::SourceRecord state;
};

[[nodiscard]] common::Result<std::vector<SourceListing>> list_sources(const Repository &repository);

[[nodiscard]] std::vector<resource::ResourceRef>
resources_from_source(const Repository &repository, const manifest::Source &source);

} // namespace aimgr::repo
