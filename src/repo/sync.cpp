#include "aimgr/repo/sync.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/discovery/discovery.hpp"
#include "aimgr/manifest/manifest.hpp"
#include "aimgr/manifest/source_state.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/repo/sources.hpp"

#include <chrono>
#include <map>
#include <set>

namespace aimgr::repo {

namespace {

using Inventory = std::vector<resource::ResourceRef>;
using ScanKey = std::pair<resource::ResourceType, std::string>;

std::set<ScanKey> scan_source(const std::filesystem::path &dir) {
  std::set<ScanKey> found;
  const auto discovered = discovery::discover_all(dir);
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    for (const auto &candidate : discovered.of(type).candidates) {
      found.emplace(type, candidate.name);
    }
  }
  return found;
}

std::string source_key(const manifest::Source &source) {
  return source.id.empty() ? source.name : source.id;
}

} // namespace

std::size_t SyncReport::synced_count() const {
  std::size_t count = 0;
  for (const auto &source : sources) {
    if (source.success) {
      ++count;
    }
  }
  return count;
}

std::size_t SyncReport::failed_count() const { return sources.size() - synced_count(); }

std::string SyncReport::summary() const {
  return "Sync Complete: " + std::to_string(synced_count()) + "/" +
         std::to_string(sources.size()) + " sources synced, " +
         std::to_string(dry_run ? 0 : removed.size()) + " resource(s) removed";
}

SyncReconciler::SyncReconciler(const Repository &repository, workspace::WorkspaceCache &cache)
    : repository_(repository), cache_(cache) {}

SyncReport SyncReconciler::sync(const SyncOptions &options) {
  SyncReport report;
  report.dry_run = options.dry_run;
  const auto started = std::chrono::steady_clock::now();

  auto loaded = manifest::Manifest::load(repository_.root());
  if (!loaded.ok()) {
    report.status = common::Status::error("failed to load manifest: " + loaded.error());
    return report;
  }
  const manifest::Manifest &document = loaded.value();
  if (document.sources().empty()) {
    report.status = common::Status::error(
        "no sync sources configured (add sources with: aimgr repo add <source>)");
    return report;
  }

  auto state = manifest::SourceState::load(repository_.root());
  if (!state.ok()) {
    observability::record_warning("sync", "starting with empty source state: " + state.error());
  }
  manifest::SourceState source_state = state.ok() ? state.value() : manifest::SourceState{};

  // Attribution is captured before any source is re-imported.
  std::map<std::string, Inventory> pre_sync;
  for (const auto &source : document.sources()) {
    pre_sync[source_key(source)] = resources_from_source(repository_, source);
  }

  std::vector<const manifest::Source *> orphan_candidates_from;
  std::map<std::string, std::set<ScanKey>> post_sync;
  // Last source whose import writes each resource; stands in for metadata in a dry run.
  std::map<ScanKey, std::string> written_by;

  for (const auto &source : document.sources()) {
    SourceSyncReport source_report{.name = source.name, .id = source.id};

    auto dir = resolve_source_dir(source, cache_, true);
    if (!dir.ok()) {
      source_report.error = dir.error();
      observability::record_source_sync(source.name, false, dir.error());
      report.sources.push_back(std::move(source_report));
      continue;
    }

    ImportOptions import_options = import_options_for(source);
    import_options.force = !options.skip_existing;
    import_options.skip_existing = options.skip_existing;
    import_options.dry_run = options.dry_run;
    const auto discovered = discovery::discover_all(dir.value());
    for (const auto &error : discovered.errors()) {
      observability::record_warning("discovery", error.path.string() + ": " + error.message);
    }
    source_report.import =
        BulkImporter(repository_).import_candidates(discovered.all(), import_options);

    auto imported = source_report.import.status();
    if (!imported.ok()) {
      source_report.error = imported.error();
      observability::record_source_sync(source.name, false, imported.error());
      report.sources.push_back(std::move(source_report));
      continue;
    }

    for (const auto &item : source_report.import.added) {
      written_by[ScanKey{item.type, item.name}] = source_key(source);
    }
    post_sync[source_key(source)] = scan_source(dir.value());
    orphan_candidates_from.push_back(&source);

    if (!options.dry_run) {
      source_state.set_last_synced(source.name, source.id, common::now_rfc3339());
    }
    source_report.success = true;
    observability::record_source_sync(source.name, true, source_report.import.summary());
    report.sources.push_back(std::move(source_report));
  }

  if (!options.dry_run && report.synced_count() > 0) {
    auto saved = source_state.save(repository_.root());
    if (!saved.ok()) {
      observability::record_warning("sync", "failed to save source state: " + saved.error());
    }
  }

  for (const auto *source : orphan_candidates_from) {
    const auto &scanned = post_sync[source_key(*source)];
    for (const auto &ref : pre_sync[source_key(*source)]) {
      if (scanned.contains(ScanKey{ref.type, ref.name})) {
        continue;
      }
      // Another source may have taken the resource over during this sync.
      if (options.dry_run) {
        const auto writer = written_by.find(ScanKey{ref.type, ref.name});
        if (writer != written_by.end() && writer->second != source_key(*source)) {
          continue;
        }
      }
      if (!repository_.has_source(ref.name, ref.type, source->id) &&
          !repository_.has_source(ref.name, ref.type, source->name)) {
        continue;
      }
      const std::string type_name(resource::resource_type_to_string(ref.type));
      observability::record_orphan("source", type_name, ref.name,
                                   repository_.resource_path(ref.name, ref.type).string());
      if (!options.dry_run) {
        auto removed = repository_.remove(ref.name, ref.type);
        if (!removed.ok()) {
          observability::record_warning("sync", "failed to remove " + type_name + "/" + ref.name +
                                                    ": " + removed.error());
          continue;
        }
      }
      report.removed.push_back(
          RemovedResource{.type = ref.type, .name = ref.name, .source_name = source->name});
    }
  }

  if (!options.dry_run && !report.removed.empty()) {
    commit_best_effort(repository_, "aimgr: remove " + std::to_string(report.removed.size()) +
                                        " resource(s) no longer in sources");
  }

  observability::record_metric(observability::SyncDurationMetric{
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started),
      .sources = report.sources.size(),
      .failed = report.failed_count(),
  });

  if (report.synced_count() == 0) {
    report.status = common::Status::error("all sources failed to sync");
  }
  return report;
}

} // namespace aimgr::repo
