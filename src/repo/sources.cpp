#include "aimgr/repo/sources.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/source/parser.hpp"

namespace aimgr::repo {

namespace {

bool is_dir(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

} // namespace

common::Result<std::filesystem::path> resolve_source_dir(const manifest::Source &source,
                                                         workspace::WorkspaceCache &cache,
                                                         const bool refresh) {
  std::filesystem::path dir;
  if (source.is_remote()) {
    auto checkout = cache.get_or_clone(source.url, source.ref, refresh);
    if (!checkout.ok()) {
      return common::Result<std::filesystem::path>::failure("source unavailable: " +
                                                            checkout.error());
    }
    dir = checkout.value();
  } else if (!source.path.empty()) {
    dir = common::absolute_path(common::expand_path(source.path));
    if (!is_dir(dir)) {
      return common::Result<std::filesystem::path>::failure(
          "source unavailable: path does not exist: " + dir.string());
    }
  } else {
    return common::Result<std::filesystem::path>::failure(
        "source unavailable: source must have either path or url");
  }

  if (!source.subpath.empty()) {
    dir /= source.subpath;
    if (!is_dir(dir)) {
      return common::Result<std::filesystem::path>::failure(
          "source unavailable: subpath '" + source.subpath + "' not found in " +
          source.location());
    }
  }
  return common::Result<std::filesystem::path>::success(dir);
}

ImportOptions import_options_for(const manifest::Source &source) {
  ImportOptions options;
  options.source_name = source.name;
  options.source_id = source.id;
  options.mode = source.import_mode();
  if (source.is_remote()) {
    options.source_url = source.url;
    options.source_type = metadata::source_type_for(source.url, true);
    options.ref = source.ref;
  } else {
    options.source_url = "file://" + common::absolute_path(source.path).string();
    options.source_type = "local";
  }
  return options;
}

common::Result<AddSourceReport> add_source(const Repository &repository,
                                           workspace::WorkspaceCache &cache,
                                           const std::string &input,
                                           const AddSourceOptions &options) {
  if (options.force && options.skip_existing) {
    return common::Result<AddSourceReport>::failure(
        "--force and --skip-existing cannot be used together");
  }

  auto parsed = source::parse_source(input);
  if (!parsed.ok()) {
    return common::Result<AddSourceReport>::failure(parsed.error());
  }

  manifest::Source entry;
  entry.name = options.name;
  if (parsed.value().is_remote()) {
    entry.url = parsed.value().clone_url();
    entry.ref = parsed.value().ref;
    entry.subpath = parsed.value().subpath;
  } else {
    entry.path = common::absolute_path(common::expand_path(parsed.value().local_path)).string();
  }

  auto loaded = manifest::Manifest::load(repository.root());
  if (!loaded.ok()) {
    return common::Result<AddSourceReport>::failure("failed to load manifest: " + loaded.error());
  }
  manifest::Manifest document = std::move(loaded.value());
  auto registered = document.add_source(entry);
  if (!registered.ok()) {
    return common::Result<AddSourceReport>::failure(registered.error());
  }

  AddSourceReport report;
  report.source = registered.value();

  auto dir = resolve_source_dir(report.source, cache);
  if (!dir.ok()) {
    return common::Result<AddSourceReport>::failure(dir.error());
  }
  report.resolved_dir = dir.value();

  report.discovered = discovery::discover_all(report.resolved_dir);
  for (const auto &error : report.discovered.errors()) {
    observability::record_warning("discovery", error.path.string() + ": " + error.message);
  }

  ImportOptions import_options = import_options_for(report.source);
  import_options.force = options.force;
  import_options.skip_existing = options.skip_existing;
  import_options.dry_run = options.dry_run;
  import_options.commit = false;
  report.import = BulkImporter(repository).import_candidates(report.discovered.all(), import_options);

  if (!options.dry_run) {
    auto saved = document.save(repository.root());
    if (!saved.ok()) {
      return common::Result<AddSourceReport>::failure(saved.error());
    }
    auto state = manifest::SourceState::load(repository.root());
    if (state.ok()) {
      state.value().set_added(report.source.name, report.source.id, common::now_rfc3339());
      auto state_saved = state.value().save(repository.root());
      if (!state_saved.ok()) {
        observability::record_warning("sources", "failed to save source state: " +
                                                     state_saved.error());
      }
    } else {
      observability::record_warning("sources", "failed to load source state: " + state.error());
    }
    commit_best_effort(repository, "aimgr: add source " + report.source.name + " (" +
                                       std::to_string(report.import.added.size()) +
                                       " resource(s))");
  }
  return common::Result<AddSourceReport>::success(std::move(report));
}

std::vector<resource::ResourceRef> resources_from_source(const Repository &repository,
                                                         const manifest::Source &source) {
  std::vector<resource::ResourceRef> refs;
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    for (const auto &record : metadata::list(repository.root(), type)) {
      if (record.has_source(source.id) || record.has_source(source.name)) {
        refs.push_back(resource::ResourceRef{.type = type, .name = record.name});
      }
    }
  }
  return refs;
}

common::Result<RemoveSourceReport> remove_source(const Repository &repository,
                                                 const std::string &key,
                                                 const RemoveSourceOptions &options) {
  auto loaded = manifest::Manifest::load(repository.root());
  if (!loaded.ok()) {
    return common::Result<RemoveSourceReport>::failure("failed to load manifest: " +
                                                       loaded.error());
  }
  manifest::Manifest document = std::move(loaded.value());
  const manifest::Source *found = document.get_source(key);
  if (found == nullptr) {
    return common::Result<RemoveSourceReport>::failure("source not found: " + key);
  }

  RemoveSourceReport report;
  report.source = *found;

  if (!options.keep_resources) {
    for (const auto &ref : resources_from_source(repository, report.source)) {
      if (options.dry_run) {
        report.removed.push_back(ref);
        continue;
      }
      auto removed = repository.remove(ref.name, ref.type);
      if (removed.ok()) {
        report.removed.push_back(ref);
      } else {
        report.failed.push_back(std::string(resource::resource_type_to_string(ref.type)) + "/" +
                                ref.name + ": " + removed.error());
      }
    }
  }

  if (options.dry_run) {
    return common::Result<RemoveSourceReport>::success(std::move(report));
  }

  auto removed = document.remove_source(key);
  if (!removed.ok()) {
    return common::Result<RemoveSourceReport>::failure(removed.error());
  }
  auto saved = document.save(repository.root());
  if (!saved.ok()) {
    return common::Result<RemoveSourceReport>::failure(saved.error());
  }

  auto state = manifest::SourceState::load(repository.root());
  if (state.ok()) {
    state.value().erase(report.source.name);
    auto state_saved = state.value().save(repository.root());
    if (!state_saved.ok()) {
      observability::record_warning("sources", "failed to save source state: " +
                                                   state_saved.error());
    }
  }

  commit_best_effort(repository, "aimgr: remove source " + report.source.name);
  return common::Result<RemoveSourceReport>::success(std::move(report));
}

common::Result<std::vector<SourceListing>> list_sources(const Repository &repository) {
  auto loaded = manifest::Manifest::load(repository.root());
  if (!loaded.ok()) {
    return common::Result<std::vector<SourceListing>>::failure("failed to load manifest: " +
                                                               loaded.error());
  }
  auto state = manifest::SourceState::load(repository.root());
  if (!state.ok()) {
    return common::Result<std::vector<SourceListing>>::failure(state.error());
  }

  std::vector<SourceListing> listings;
  for (const auto &source : loaded.value().sources()) {
    SourceListing listing{.source = source};
    if (const auto *record = state.value().get(source.name); record != nullptr) {
      listing.state = *record;
    }
    listings.push_back(std::move(listing));
  }
  return common::Result<std::vector<SourceListing>>::success(std::move(listings));
}

} // namespace aimgr::repo
