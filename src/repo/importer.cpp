#include "aimgr/repo/importer.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/observability/global.hpp"

#include <sstream>

namespace aimgr::repo {

namespace {

std::string type_name(const resource::ResourceType type) {
  return std::string(resource::resource_type_to_string(type));
}

void count_type(ImportResult &result, const resource::ResourceType type) {
  switch (type) {
  case resource::ResourceType::Command:
    ++result.command_count;
    break;
  case resource::ResourceType::Skill:
    ++result.skill_count;
    break;
  case resource::ResourceType::Agent:
    ++result.agent_count;
    break;
  case resource::ResourceType::Package:
    ++result.package_count;
    break;
  }
}

void fail(ImportResult &result, const std::filesystem::path &path, const std::string &message,
          const std::string &type = "", const std::string &name = "", const bool conflict = false) {
  result.failed.push_back(
      ImportFailure{.source_path = path, .message = message, .conflict = conflict});
  observability::record_import(type, name.empty() ? path.string() : name, "failed", message);
}

std::string commit_message(const ImportResult &result) {
  std::ostringstream out;
  out << "aimgr: import " << result.added.size() << " resource(s)";
  std::vector<std::string> details;
  if (result.command_count > 0) {
    details.push_back(std::to_string(result.command_count) + " command(s)");
  }
  if (result.skill_count > 0) {
    details.push_back(std::to_string(result.skill_count) + " skill(s)");
  }
  if (result.agent_count > 0) {
    details.push_back(std::to_string(result.agent_count) + " agent(s)");
  }
  if (result.package_count > 0) {
    details.push_back(std::to_string(result.package_count) + " package(s)");
  }
  if (!details.empty()) {
    out << " (";
    for (std::size_t i = 0; i < details.size(); ++i) {
      out << (i == 0 ? "" : ", ") << details[i];
    }
    out << ")";
  }
  return out.str();
}

} // namespace

common::Status ImportResult::status() const {
  std::size_t conflicts = 0;
  for (const auto &failure : failed) {
    if (failure.conflict) {
      ++conflicts;
    }
  }
  if (conflicts == 0) {
    return common::Status::success();
  }
  return common::Status::error(std::to_string(conflicts) +
                               " resource(s) already exist in repository "
                               "(use --force to overwrite or --skip-existing to skip)");
}

std::string ImportResult::summary() const {
  return "Added: " + std::to_string(added.size()) + ", Skipped: " +
         std::to_string(skipped.size()) + ", Failed: " + std::to_string(failed.size());
}

BulkImporter::BulkImporter(const Repository &repository) : repository_(repository) {}

ImportResult BulkImporter::import_candidates(const std::vector<discovery::Candidate> &candidates,
                                             const ImportOptions &options) const {
  std::vector<std::filesystem::path> paths;
  std::vector<std::optional<resource::ResourceType>> types;
  for (const auto &candidate : candidates) {
    paths.push_back(candidate.path);
    types.emplace_back(candidate.type);
  }
  return import_batch(paths, types, options);
}

ImportResult BulkImporter::import_paths(const std::vector<std::filesystem::path> &paths,
                                        const ImportOptions &options) const {
  return import_batch(paths, std::vector<std::optional<resource::ResourceType>>(paths.size()),
                      options);
}

ImportResult BulkImporter::import_batch(
    const std::vector<std::filesystem::path> &paths,
    const std::vector<std::optional<resource::ResourceType>> &types,
    const ImportOptions &options) const {
  ImportResult result;
  if (!options.dry_run) {
    auto initialized = repository_.init();
    if (!initialized.ok()) {
      for (const auto &path : paths) {
        fail(result, path, initialized.error());
      }
      return result;
    }
  }

  std::set<std::filesystem::path> batch_targets;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    import_one(paths[i], types[i], options, result, batch_targets);
  }

  observability::record_metric(observability::BulkImportMetric{
      .added = result.added.size(),
      .updated = result.updated.size(),
      .skipped = result.skipped.size(),
      .failed = result.failed.size(),
      .dry_run = options.dry_run,
  });

  if (!options.dry_run && options.commit && !result.added.empty()) {
    commit_best_effort(repository_, commit_message(result));
  }
  return result;
}

void BulkImporter::import_one(const std::filesystem::path &path,
                              const std::optional<resource::ResourceType> type,
                              const ImportOptions &options, ImportResult &result,
                              std::set<std::filesystem::path> &batch_targets) const {
  auto loaded = type.has_value() ? resource::kind_for(*type).load(path)
                                 : resource::load_resource(path);
  if (!loaded.ok()) {
    fail(result, path, "failed to load resource: " + loaded.error());
    return;
  }
  const resource::Resource &item = loaded.value();
  const auto &kind = resource::kind_for(item.type);
  const std::string kind_name = type_name(item.type);

  auto valid = kind.validate(item);
  if (!valid.ok()) {
    fail(result, path, valid.error(), kind_name, item.name);
    return;
  }

  const auto dest = repository_.resource_path(item.name, item.type);
  if (!batch_targets.insert(dest).second) {
    fail(result, path, "duplicate " + kind_name + " '" + item.name + "' in import batch", kind_name,
         item.name);
    return;
  }
  std::error_code ec;
  const bool exists = std::filesystem::exists(dest, ec);
  std::string first_installed;

  if (exists) {
    if (options.force) {
      if (auto previous = metadata::load(repository_.root(), item.name, item.type);
          previous.ok()) {
        first_installed = previous.value().first_installed;
      }
      if (!options.dry_run) {
        auto removed = repository_.remove(item.name, item.type);
        if (!removed.ok()) {
          fail(result, path, "failed to remove existing resource: " + removed.error(), kind_name,
               item.name);
          return;
        }
      }
    } else if (options.skip_existing) {
      result.skipped.push_back(
          ImportedItem{.type = item.type, .name = item.name, .source_path = path});
      observability::record_import(kind_name, item.name, "skipped");
      return;
    } else {
      fail(result, path, "resource '" + item.name + "' already exists in repository", kind_name,
           item.name, true);
      return;
    }
  }

  if (!options.dry_run) {
    if (common::entry_exists(dest)) {
      // Dangling link left behind by a moved source.
      std::filesystem::remove(dest, ec);
    }
    auto stored = kind.store(item, repository_.root(), options.mode);
    if (!stored.ok()) {
      fail(result, path, "failed to import resource: " + stored.error(), kind_name, item.name);
      return;
    }

    const std::string now = common::now_rfc3339();
    const bool has_url = !options.source_url.empty() && !options.source_type.empty();
    metadata::ResourceMetadata record{
        .name = item.name,
        .type = item.type,
        .source_type = has_url ? options.source_type : "file",
        .source_url = has_url ? options.source_url
                              : "file://" + common::absolute_path(path).string(),
        .source_name = options.source_name,
        .source_id = options.source_id,
        .ref = has_url ? options.ref : "",
        .first_installed = first_installed.empty() ? now : first_installed,
        .last_updated = now,
        .resource_count = static_cast<int>(item.references.size()),
    };
    auto saved = metadata::save(repository_.root(), record);
    if (!saved.ok()) {
      fail(result, path, "failed to save metadata: " + saved.error(), kind_name, item.name);
      return;
    }

    if (item.type == resource::ResourceType::Package) {
      for (const auto &missing : repository_.missing_package_references(item)) {
        observability::record_warning("import", "package '" + item.name +
                                                    "' references missing resource " + missing);
      }
    }
  }

  count_type(result, item.type);
  const ImportedItem imported{.type = item.type, .name = item.name, .source_path = path};
  result.added.push_back(imported);
  if (exists) {
    result.updated.push_back(imported);
  }
  observability::record_import(kind_name, item.name, exists ? "updated" : "added");
}

} // namespace aimgr::repo
