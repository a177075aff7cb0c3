#include "aimgr/repo/maintenance.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/discovery/discovery.hpp"
#include "aimgr/manifest/manifest.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/repo/importer.hpp"
#include "aimgr/repo/sources.hpp"
#include "aimgr/resource/kind.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace aimgr::repo {

namespace {

const std::string FILE_SCHEME = "file://";

std::string type_name(const resource::ResourceType type) {
  return std::string(resource::resource_type_to_string(type));
}

std::filesystem::path local_path_of(const std::string &url) {
  if (common::starts_with(url, FILE_SCHEME)) {
    return std::filesystem::path(url.substr(FILE_SCHEME.size())).lexically_normal();
  }
  return url;
}

bool is_local_record(const metadata::ResourceMetadata &record) {
  return record.source_type == "local" || record.source_type == "file" ||
         common::starts_with(record.source_url, FILE_SCHEME);
}

// Where a resource is re-imported from: a configured or reconstructed source, or the
// single file a bare import recorded.
struct Origin {
  std::optional<manifest::Source> source;
  std::filesystem::path file;
};

std::optional<Origin> origin_of(const metadata::ResourceMetadata &record,
                                const manifest::Manifest &document) {
  for (const auto &source : document.sources()) {
    if (!record.source_id.empty() && source.id == record.source_id) {
      return Origin{.source = source};
    }
  }
  if (!record.source_name.empty()) {
    if (const auto *source = document.get_source(record.source_name); source != nullptr) {
      return Origin{.source = *source};
    }
  }
  if (record.source_url.empty()) {
    return std::nullopt;
  }
  if (record.source_type == "file") {
    return Origin{.file = local_path_of(record.source_url)};
  }

  manifest::Source source;
  source.id = record.source_id;
  source.name = record.source_name;
  if (is_local_record(record)) {
    source.path = local_path_of(record.source_url).string();
  } else {
    source.url = record.source_url;
    source.ref = record.ref;
  }
  return Origin{.source = std::move(source)};
}

std::string source_key(const manifest::Source &source) {
  return source.id + "|" + source.location() + "|" + source.subpath;
}

class Updater {
public:
  Updater(const Repository &repository, workspace::WorkspaceCache &cache,
          const manifest::Manifest &document, const UpdateOptions &options)
      : repository_(repository), cache_(cache), document_(document), options_(options) {}

  UpdatedResource update(const metadata::ResourceMetadata &record) {
    UpdatedResource item{.type = record.type, .name = record.name};
    const auto origin = origin_of(record, document_);
    if (!origin.has_value()) {
      item.message = "no source recorded for " + type_name(record.type) + " '" + record.name + "'";
      return item;
    }
    if (origin->source.has_value()) {
      update_from_source(*origin->source, record, item);
    } else {
      update_from_file(origin->file, record, item);
    }

    if (item.outcome == UpdateOutcome::Skipped) {
      observability::record_warning("update", type_name(item.type) + "/" + item.name +
                                                  " skipped: " + item.message);
    }
    return item;
  }

private:
  ImportOptions base_options(ImportOptions options) const {
    options.force = true;
    options.skip_existing = false;
    options.dry_run = options_.dry_run;
    options.commit = false;
    return options;
  }

  static void apply(const ImportResult &result, const std::string &from, const bool dry_run,
                    UpdatedResource &item) {
    if (!result.failed.empty()) {
      item.outcome = UpdateOutcome::Failed;
      item.message = result.failed.front().message;
      return;
    }
    item.outcome = UpdateOutcome::Updated;
    item.message = (dry_run ? "would update from " : "updated from ") + from;
  }

  void update_from_file(const std::filesystem::path &file,
                        const metadata::ResourceMetadata &record, UpdatedResource &item) const {
    if (!common::entry_exists(file)) {
      item.outcome = UpdateOutcome::Skipped;
      item.message = "source path no longer exists: " + file.string();
      return;
    }
    ImportOptions options;
    options.source_name = record.source_name;
    options.source_id = record.source_id;
    const auto result = BulkImporter(repository_).import_paths({file}, base_options(options));
    apply(result, file.string(), options_.dry_run, item);
  }

  void update_from_source(const manifest::Source &source,
                          const metadata::ResourceMetadata &record, UpdatedResource &item) {
    if (options_.dry_run && source.is_remote()) {
      item.outcome = UpdateOutcome::Updated;
      item.message = "would update from " + source.url;
      return;
    }

    const auto *discovered = discover(source);
    if (discovered == nullptr) {
      item.outcome = UpdateOutcome::Skipped;
      item.message = resolve_errors_[source_key(source)];
      return;
    }

    const auto &candidates = discovered->of(record.type).candidates;
    const auto match = std::find_if(candidates.begin(), candidates.end(),
                                    [&](const discovery::Candidate &candidate) {
                                      return candidate.name == record.name;
                                    });
    if (match == candidates.end()) {
      item.message = type_name(record.type) + " '" + record.name + "' is no longer provided by " +
                     source.location();
      return;
    }

    const auto result = BulkImporter(repository_).import_candidates(
        {*match}, base_options(import_options_for(source)));
    apply(result, source.location(), options_.dry_run, item);
  }

  // Resolves and scans each source once per run; remote clones are refreshed.
  const discovery::DiscoveredResources *discover(const manifest::Source &source) {
    const std::string key = source_key(source);
    if (const auto it = discovered_.find(key); it != discovered_.end()) {
      return &it->second;
    }
    if (resolve_errors_.contains(key)) {
      return nullptr;
    }
    auto dir = resolve_source_dir(source, cache_, !options_.dry_run);
    if (!dir.ok()) {
      resolve_errors_[key] = dir.error();
      return nullptr;
    }
    return &discovered_.emplace(key, discovery::discover_all(dir.value())).first->second;
  }

  const Repository &repository_;
  workspace::WorkspaceCache &cache_;
  const manifest::Manifest &document_;
  const UpdateOptions &options_;
  std::map<std::string, discovery::DiscoveredResources> discovered_;
  std::map<std::string, std::string> resolve_errors_;
};

std::vector<metadata::ResourceMetadata> sorted_records(const Repository &repository) {
  std::vector<metadata::ResourceMetadata> records;
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    auto listed = metadata::list(repository.root(), type);
    std::sort(listed.begin(), listed.end(),
              [](const auto &a, const auto &b) { return a.name < b.name; });
    records.insert(records.end(), listed.begin(), listed.end());
  }
  return records;
}

metadata::ResourceMetadata metadata_for_untracked(const Repository &repository,
                                                  const OrphanedFile &file) {
  std::error_code ec;
  std::filesystem::path origin = file.path;
  if (std::filesystem::is_symlink(std::filesystem::symlink_status(file.path, ec))) {
    const auto target = std::filesystem::read_symlink(file.path, ec);
    if (!ec) {
      origin = target.is_absolute() ? target : file.path.parent_path() / target;
    }
  }

  const std::string now = common::now_rfc3339();
  metadata::ResourceMetadata record{
      .name = file.name,
      .type = file.type,
      .source_type = "file",
      .source_url = "file://" + common::absolute_path(origin).string(),
      .first_installed = now,
      .last_updated = now,
  };
  if (file.type == resource::ResourceType::Package) {
    if (auto loaded = repository.get(file.name, file.type); loaded.ok()) {
      record.resource_count = static_cast<int>(loaded.value().references.size());
    }
  }
  return record;
}

} // namespace

std::size_t UpdateReport::count(const UpdateOutcome outcome) const {
  return static_cast<std::size_t>(
      std::count_if(items.begin(), items.end(),
                    [outcome](const UpdatedResource &item) { return item.outcome == outcome; }));
}

std::string UpdateReport::summary() const {
  const auto updated = std::to_string(count(UpdateOutcome::Updated));
  const auto failed = std::to_string(count(UpdateOutcome::Failed));
  const auto skipped = std::to_string(count(UpdateOutcome::Skipped));
  if (dry_run) {
    return "Summary (dry run): " + updated + " would be updated, " + failed + " would fail, " +
           skipped + " would be skipped";
  }
  return "Summary: " + updated + " updated, " + failed + " failed, " + skipped + " skipped";
}

common::Result<UpdateReport> update_resources(const Repository &repository,
                                              workspace::WorkspaceCache &cache,
                                              const std::vector<resource::ResourceRef> &refs,
                                              const UpdateOptions &options) {
  auto loaded = manifest::Manifest::load(repository.root());
  if (!loaded.ok()) {
    return common::Result<UpdateReport>::failure("failed to load manifest: " + loaded.error());
  }

  UpdateReport report;
  report.dry_run = options.dry_run;
  Updater updater(repository, cache, loaded.value(), options);

  if (refs.empty()) {
    for (const auto &record : sorted_records(repository)) {
      report.items.push_back(updater.update(record));
    }
  } else {
    std::set<std::pair<resource::ResourceType, std::string>> seen;
    for (const auto &ref : refs) {
      if (!seen.emplace(ref.type, ref.name).second) {
        continue;
      }
      auto record = repository.metadata(ref.name, ref.type);
      if (record.ok()) {
        report.items.push_back(updater.update(record.value()));
        continue;
      }
      const std::string label = type_name(ref.type) + " '" + ref.name + "'";
      report.items.push_back(UpdatedResource{
          .type = ref.type,
          .name = ref.name,
          .outcome = UpdateOutcome::Failed,
          .message = repository.resource_exists(ref.name, ref.type) ? "no metadata for " + label
                                                                    : label + " not found",
      });
    }
  }

  const std::size_t updated = report.count(UpdateOutcome::Updated);
  if (!options.dry_run && updated > 0) {
    commit_best_effort(repository,
                       "aimgr: update " + std::to_string(updated) + " resource(s) from sources");
  }
  return common::Result<UpdateReport>::success(std::move(report));
}

bool VerifyReport::has_errors() const {
  return (!fixed && !orphaned_metadata.empty()) || !packages_with_missing_refs.empty();
}

bool VerifyReport::has_warnings() const {
  return (!fixed && !resources_without_metadata.empty()) || !missing_source_paths.empty();
}

common::Result<VerifyReport> verify_repository(const Repository &repository,
                                               const VerifyOptions &options) {
  VerifyReport report;
  report.fixed = options.fix;
  if (!common::entry_exists(repository.root())) {
    return common::Result<VerifyReport>::success(std::move(report));
  }

  auto orphans = repository.find_orphans();
  report.resources_without_metadata = std::move(orphans.files);
  report.orphaned_metadata = std::move(orphans.metadata);

  for (const auto &record : sorted_records(repository)) {
    if (!is_local_record(record) || record.source_url.empty()) {
      continue;
    }
    if (!common::entry_exists(local_path_of(record.source_url))) {
      report.missing_source_paths.push_back(record);
    }
  }

  const auto &packages = resource::kind_for(resource::ResourceType::Package);
  for (const auto &entry : packages.scan(repository.root())) {
    auto package = packages.load(entry.path);
    if (!package.ok()) {
      continue;
    }
    auto missing = repository.missing_package_references(package.value());
    if (!missing.empty()) {
      report.packages_with_missing_refs.push_back(
          PackageIssue{.name = entry.name, .missing = std::move(missing)});
    }
  }

  if (!options.fix) {
    return common::Result<VerifyReport>::success(std::move(report));
  }

  std::size_t changes = 0;
  for (const auto &file : report.resources_without_metadata) {
    auto saved = metadata::save(repository.root(), metadata_for_untracked(repository, file));
    if (!saved.ok()) {
      return common::Result<VerifyReport>::failure("failed to create metadata for " +
                                                   type_name(file.type) + " '" + file.name +
                                                   "': " + saved.error());
    }
    ++changes;
  }
  for (const auto &record : report.orphaned_metadata) {
    auto removed = metadata::remove(repository.root(), record.name, record.type);
    if (!removed.ok()) {
      return common::Result<VerifyReport>::failure("failed to remove metadata for " +
                                                   type_name(record.type) + " '" + record.name +
                                                   "': " + removed.error());
    }
    ++changes;
  }
  if (changes > 0) {
    commit_best_effort(repository, "aimgr: repair " + std::to_string(changes) +
                                       " metadata record(s)");
  }
  return common::Result<VerifyReport>::success(std::move(report));
}

std::uintmax_t PruneReport::total_bytes() const {
  std::uintmax_t total = 0;
  for (const auto &checkout : unreferenced) {
    total += checkout.size_bytes;
  }
  return total;
}

common::Result<PruneReport> prune_workspace(const Repository &repository,
                                            workspace::WorkspaceCache &cache,
                                            const PruneOptions &options) {
  auto loaded = manifest::Manifest::load(repository.root());
  if (!loaded.ok()) {
    return common::Result<PruneReport>::failure("failed to load manifest: " + loaded.error());
  }

  std::set<std::string> referenced;
  for (const auto &source : loaded.value().sources()) {
    if (source.is_remote()) {
      referenced.insert(cache.cache_path(source.url).filename().string());
    }
  }
  for (const auto &record : sorted_records(repository)) {
    if (!record.source_url.empty() && !is_local_record(record)) {
      referenced.insert(cache.cache_path(record.source_url).filename().string());
    }
  }

  PruneReport report;
  report.dry_run = options.dry_run;
  for (auto &checkout : cache.list_cached()) {
    if (!referenced.contains(checkout.hash)) {
      report.unreferenced.push_back(std::move(checkout));
    }
  }
  if (options.dry_run) {
    return common::Result<PruneReport>::success(std::move(report));
  }

  for (const auto &checkout : report.unreferenced) {
    auto removed = cache.remove_cached(checkout.hash);
    if (!removed.ok()) {
      ++report.failed;
      observability::record_warning("prune", removed.error());
      continue;
    }
    ++report.removed;
    report.freed_bytes += checkout.size_bytes;
  }
  return common::Result<PruneReport>::success(std::move(report));
}

std::string format_size(const std::uintmax_t bytes) {
  static constexpr const char *UNITS[] = {"B", "KB", "MB", "GB", "TB"};
  if (bytes < 1024) {
    return std::to_string(bytes) + " B";
  }
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(UNITS)) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << " " << UNITS[unit];
  return out.str();
}

} // namespace aimgr::repo
