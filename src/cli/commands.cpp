#include "aimgr/cli/commands.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/config/config.hpp"
#include "aimgr/install/installer.hpp"
#include "aimgr/observability/factory.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/repo/maintenance.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/repo/sources.hpp"
#include "aimgr/repo/sync.hpp"
#include "aimgr/tools/tools.hpp"
#include "aimgr/workspace/cache.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace aimgr::cli {

namespace {

std::string version_string() {
#ifdef AIMGR_VERSION
  std::string version = AIMGR_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef AIMGR_GIT_COMMIT
  const std::string commit = AIMGR_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "aimgr " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

// Collects every occurrence of a repeatable option; comma lists are split.
std::vector<std::string> take_options(std::vector<std::string> &args, const std::string &long_name,
                                      const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    for (const auto &part : common::split(value, ',')) {
      const std::string trimmed = common::trim(part);
      if (!trimmed.empty()) {
        values.push_back(trimmed);
      }
    }
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, bool &verbose, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    if (args[i] == "--verbose" || args[i] == "-v") {
      verbose = true;
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool reject_unknown_flags(const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      std::cerr << "unknown option: " << arg << "\n";
      return false;
    }
  }
  return true;
}

struct Context {
  config::Config config;
  std::filesystem::path repo_root;
};

common::Result<Context> load_context() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<Context>::failure(loaded.error());
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<Context>::failure(warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  auto root = config::resolve_repo_path(loaded.value(), config::repo_path_env_from_process());
  if (!root.ok()) {
    return common::Result<Context>::failure(root.error());
  }
  return common::Result<Context>::success(
      Context{.config = loaded.value(), .repo_root = root.value()});
}

void install_observer(const config::Config &config, const bool verbose) {
  observability::set_global_observer(observability::create_observer(config, verbose));
}

// "type/name", where the type may also be a package.
common::Result<resource::ResourceRef> parse_reference(const std::string &reference) {
  const auto slash = reference.find('/');
  if (slash == std::string::npos) {
    return common::Result<resource::ResourceRef>::failure(
        "invalid resource format: \"" + reference + "\" (expected type/name)");
  }
  const auto type = resource::parse_resource_type(reference.substr(0, slash));
  if (!type.has_value()) {
    return common::Result<resource::ResourceRef>::failure(
        "invalid resource type: \"" + reference.substr(0, slash) +
        "\" (expected command/skill/agent/package)");
  }
  const std::string name = reference.substr(slash + 1);
  if (name.empty()) {
    return common::Result<resource::ResourceRef>::failure(
        "resource name cannot be empty in: \"" + reference + "\"");
  }
  return common::Result<resource::ResourceRef>::success(
      resource::ResourceRef{.type = *type, .name = name});
}

std::string ref_string(const resource::ResourceType type, const std::string &name) {
  return std::string(resource::resource_type_to_string(type)) + "/" + name;
}

std::string join_tools(const std::vector<tools::Tool> &list) {
  std::string joined;
  for (const auto tool : list) {
    joined += (joined.empty() ? "" : ", ") + std::string(tools::tool_name(tool));
  }
  return joined;
}

void print_import(const repo::ImportResult &result, const bool dry_run) {
  const std::string verb = dry_run ? "would add" : "added";
  for (const auto &item : result.added) {
    const bool overwrite = std::any_of(result.updated.begin(), result.updated.end(),
                                       [&](const repo::ImportedItem &updated) {
                                         return updated.type == item.type &&
                                                updated.name == item.name;
                                       });
    std::cout << "  " << (overwrite ? (dry_run ? "would update" : "updated") : verb) << "  "
              << ref_string(item.type, item.name) << "\n";
  }
  for (const auto &item : result.skipped) {
    std::cout << "  skipped  " << ref_string(item.type, item.name) << "\n";
  }
  for (const auto &failure : result.failed) {
    std::cerr << "  failed   " << failure.source_path.string() << ": " << failure.message << "\n";
  }
  std::cout << result.summary() << "\n";
}

int run_repo_init(const Context &context) {
  repo::Repository repository(context.repo_root);
  auto status = repository.init();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "Initialized repository at " << context.repo_root.string() << "\n";
  return 0;
}

int run_repo_add(const Context &context, std::vector<std::string> args) {
  repo::AddSourceOptions options;
  options.force = take_flag(args, "--force") || take_flag(args, "-f");
  options.skip_existing = take_flag(args, "--skip-existing");
  options.dry_run = take_flag(args, "--dry-run");
  (void)take_option(args, "--name", "", options.name);
  if (!reject_unknown_flags(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: aimgr repo add <source> [--force|--skip-existing] [--dry-run] "
                 "[--name NAME]\n";
    return 1;
  }
  if (options.force && options.skip_existing) {
    std::cerr << "--force and --skip-existing are mutually exclusive\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  workspace::WorkspaceCache cache(context.repo_root);
  auto added = repo::add_source(repository, cache, args[0], options);
  if (!added.ok()) {
    std::cerr << added.error() << "\n";
    return 1;
  }

  const auto &report = added.value();
  std::cout << "Source: " << report.source.name << " (" << report.source.location() << ")\n";
  std::cout << report.discovered.summary() << "\n";
  for (const auto &error : report.discovered.errors()) {
    std::cerr << "  warning: " << error.path.string() << ": " << error.message << "\n";
  }
  print_import(report.import, options.dry_run);
  if (options.dry_run) {
    std::cout << "Dry run: no changes made\n";
  }

  auto status = report.import.status();
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

int run_repo_remove(const Context &context, std::vector<std::string> args) {
  repo::RemoveSourceOptions options;
  options.dry_run = take_flag(args, "--dry-run");
  options.keep_resources = take_flag(args, "--keep-resources");
  if (!reject_unknown_flags(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: aimgr repo remove <name|path|url> [--dry-run] [--keep-resources]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  auto removed = repo::remove_source(repository, args[0], options);
  if (!removed.ok()) {
    std::cerr << removed.error() << "\n";
    return 1;
  }

  const auto &report = removed.value();
  const std::string verb = options.dry_run ? "would remove" : "removed";
  for (const auto &ref : report.removed) {
    std::cout << "  " << verb << "  " << ref_string(ref.type, ref.name) << "\n";
  }
  for (const auto &failure : report.failed) {
    std::cerr << "  failed  " << failure << "\n";
  }
  std::cout << (options.dry_run ? "Would remove" : "Removed") << " source '" << report.source.name
            << "' and " << report.removed.size() << " resource(s)\n";
  return report.failed.empty() ? 0 : 1;
}

int run_repo_sync(const Context &context, std::vector<std::string> args) {
  repo::SyncOptions options;
  options.skip_existing = take_flag(args, "--skip-existing");
  options.dry_run = take_flag(args, "--dry-run");
  if (!reject_unknown_flags(args) || !args.empty()) {
    std::cerr << "usage: aimgr repo sync [--skip-existing] [--dry-run]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  workspace::WorkspaceCache cache(context.repo_root);
  repo::SyncReconciler reconciler(repository, cache);
  const auto report = reconciler.sync(options);

  for (const auto &source : report.sources) {
    if (!source.success) {
      std::cerr << "✗ " << source.name << ": " << source.error << "\n";
      continue;
    }
    std::cout << "✓ " << source.name << "\n";
    print_import(source.import, options.dry_run);
  }
  const std::string verb = options.dry_run ? "would remove" : "removed";
  for (const auto &removed : report.removed) {
    std::cout << "  " << verb << "  " << ref_string(removed.type, removed.name) << " (from "
              << removed.source_name << ")\n";
  }
  if (!report.sources.empty()) {
    std::cout << report.summary() << "\n";
  }
  if (!report.status.ok()) {
    std::cerr << report.status.error() << "\n";
    return 1;
  }
  return 0;
}

int run_repo_list(const Context &context, std::vector<std::string> args) {
  std::string type_raw;
  std::optional<resource::ResourceType> type;
  if (take_option(args, "--type", "-t", type_raw)) {
    type = resource::parse_resource_type(type_raw);
    if (!type.has_value()) {
      std::cerr << "invalid resource type: " << type_raw << "\n";
      return 1;
    }
  }

  repo::Repository repository(context.repo_root);
  auto listed = repository.list(type);
  if (!listed.ok()) {
    std::cerr << listed.error() << "\n";
    return 1;
  }
  if (listed.value().empty()) {
    std::cout << "No resources found\n";
    return 0;
  }
  for (const auto &resource : listed.value()) {
    std::cout << resource.id();
    if (!resource.description.empty()) {
      std::cout << "  " << resource.description;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_repo_sources(const Context &context) {
  repo::Repository repository(context.repo_root);
  auto listed = repo::list_sources(repository);
  if (!listed.ok()) {
    std::cerr << listed.error() << "\n";
    return 1;
  }
  if (listed.value().empty()) {
    std::cout << "No sources configured\n";
    return 0;
  }
  for (const auto &entry : listed.value()) {
    const auto &source = entry.source;
    std::cout << source.name << "\n";
    std::cout << "  id:       " << source.id << "\n";
    std::cout << "  location: " << source.location() << "\n";
    if (!source.ref.empty()) {
      std::cout << "  ref:      " << source.ref << "\n";
    }
    if (!source.subpath.empty()) {
      std::cout << "  subpath:  " << source.subpath << "\n";
    }
    std::cout << "  mode:     " << resource::import_mode_to_string(source.import_mode()) << "\n";
    if (!entry.state.added.empty()) {
      std::cout << "  added:    " << entry.state.added << "\n";
    }
    std::cout << "  synced:   " << (entry.state.last_synced.empty() ? "never" : entry.state.last_synced)
              << "\n";
  }
  return 0;
}

int run_repo_show(const Context &context, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    std::cerr << "usage: aimgr repo show <type/name>\n";
    return 1;
  }
  auto ref = parse_reference(args[0]);
  if (!ref.ok()) {
    std::cerr << ref.error() << "\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  auto found = repository.get(ref.value().name, ref.value().type);
  if (!found.ok()) {
    std::cerr << found.error() << "\n";
    return 1;
  }
  const auto &resource = found.value();
  std::cout << resource.id() << "\n";
  std::cout << "  description: " << resource.description << "\n";
  if (!resource.version.empty()) {
    std::cout << "  version:     " << resource.version << "\n";
  }
  if (!resource.author.empty()) {
    std::cout << "  author:      " << resource.author << "\n";
  }
  std::cout << "  path:        " << repository.resource_path(resource.name, resource.type).string()
            << "\n";
  for (const auto &reference : resource.references) {
    std::cout << "  includes:    " << reference << "\n";
  }
  for (const auto &missing : repository.missing_package_references(resource)) {
    std::cerr << "  warning: missing " << missing << "\n";
  }

  auto meta = repository.metadata(resource.name, resource.type);
  if (meta.ok()) {
    const auto &m = meta.value();
    std::cout << "  source:      " << (m.source_name.empty() ? m.source_url : m.source_name)
              << " (" << m.source_type << ")\n";
    if (!m.ref.empty()) {
      std::cout << "  ref:         " << m.ref << "\n";
    }
    std::cout << "  installed:   " << m.first_installed << "\n";
    std::cout << "  updated:     " << m.last_updated << "\n";
  }
  return 0;
}

int run_repo_delete(const Context &context, const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: aimgr repo delete <type/name>...\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  int exit_code = 0;
  std::size_t removed = 0;
  for (const auto &arg : args) {
    auto ref = parse_reference(arg);
    if (!ref.ok()) {
      std::cerr << ref.error() << "\n";
      exit_code = 1;
      continue;
    }
    auto status = repository.remove(ref.value().name, ref.value().type);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      exit_code = 1;
      continue;
    }
    ++removed;
    std::cout << "Removed " << ref_string(ref.value().type, ref.value().name) << "\n";
  }
  if (removed > 0) {
    repo::commit_best_effort(repository,
                             "aimgr: remove " + std::to_string(removed) + " resource(s)");
  }
  return exit_code;
}

int run_repo_update(const Context &context, std::vector<std::string> args) {
  repo::UpdateOptions options;
  options.dry_run = take_flag(args, "--dry-run");
  if (!reject_unknown_flags(args)) {
    std::cerr << "usage: aimgr repo update [type/name...] [--dry-run]\n";
    return 1;
  }

  std::vector<resource::ResourceRef> refs;
  for (const auto &arg : args) {
    auto ref = parse_reference(arg);
    if (!ref.ok()) {
      std::cerr << ref.error() << "\n";
      return 1;
    }
    refs.push_back(ref.value());
  }

  repo::Repository repository(context.repo_root);
  workspace::WorkspaceCache cache(context.repo_root);
  auto report = repo::update_resources(repository, cache, refs, options);
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }
  if (report.value().items.empty()) {
    std::cout << "No resources to update\n";
    return 0;
  }

  for (const auto &item : report.value().items) {
    const std::string label = ref_string(item.type, item.name);
    switch (item.outcome) {
    case repo::UpdateOutcome::Updated:
      std::cout << "  ✓ " << label << ": " << item.message << "\n";
      break;
    case repo::UpdateOutcome::Skipped:
      std::cout << "  ⊘ " << label << ": " << item.message << "\n";
      break;
    case repo::UpdateOutcome::Failed:
      std::cerr << "  ✗ " << label << ": " << item.message << "\n";
      break;
    }
  }
  std::cout << report.value().summary() << "\n";
  if (report.value().count(repo::UpdateOutcome::Skipped) > 0) {
    std::cout << "Hint: run 'aimgr repo verify' to find resources whose source is missing, "
                 "then 'aimgr repo delete' or 'aimgr repo remove' to clean them up\n";
  }
  return report.value().count(repo::UpdateOutcome::Failed) > 0 ? 1 : 0;
}

int run_repo_verify(const Context &context, std::vector<std::string> args) {
  repo::VerifyOptions options;
  options.fix = take_flag(args, "--fix");
  if (!reject_unknown_flags(args) || !args.empty()) {
    std::cerr << "usage: aimgr repo verify [--fix]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  auto verified = repo::verify_repository(repository, options);
  if (!verified.ok()) {
    std::cerr << verified.error() << "\n";
    return 1;
  }
  const auto &report = verified.value();

  for (const auto &file : report.resources_without_metadata) {
    std::cout << (options.fix ? "  fixed    " : "  warning  ") << ref_string(file.type, file.name)
              << ": resource has no metadata" << (options.fix ? " (created)" : "") << "\n";
  }
  for (const auto &record : report.orphaned_metadata) {
    std::cout << (options.fix ? "  fixed    " : "  error    ")
              << ref_string(record.type, record.name) << ": metadata without resource"
              << (options.fix ? " (removed)" : "") << "\n";
  }
  for (const auto &record : report.missing_source_paths) {
    std::cout << "  warning  " << ref_string(record.type, record.name)
              << ": source path no longer exists: " << record.source_url << "\n";
  }
  for (const auto &package : report.packages_with_missing_refs) {
    std::string missing;
    for (const auto &ref : package.missing) {
      missing += (missing.empty() ? "" : ", ") + ref;
    }
    std::cout << "  error    package/" << package.name << ": missing " << missing << "\n";
  }

  if (!report.has_errors() && !report.has_warnings()) {
    std::cout << "Repository is consistent\n";
  } else if (!options.fix && (!report.resources_without_metadata.empty() ||
                              !report.orphaned_metadata.empty())) {
    std::cout << "Run 'aimgr repo verify --fix' to resolve metadata issues\n";
  }
  return report.has_errors() ? 1 : 0;
}

int run_repo_prune(const Context &context, std::vector<std::string> args) {
  repo::PruneOptions options;
  options.dry_run = take_flag(args, "--dry-run");
  if (!reject_unknown_flags(args) || !args.empty()) {
    std::cerr << "usage: aimgr repo prune [--dry-run]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  workspace::WorkspaceCache cache(context.repo_root);
  auto pruned = repo::prune_workspace(repository, cache, options);
  if (!pruned.ok()) {
    std::cerr << pruned.error() << "\n";
    return 1;
  }
  const auto &report = pruned.value();
  if (report.unreferenced.empty()) {
    std::cout << "No unreferenced workspace caches found\n";
    return 0;
  }
  for (const auto &checkout : report.unreferenced) {
    std::cout << "  " << (checkout.url.empty() ? checkout.hash : checkout.url) << " ("
              << repo::format_size(checkout.size_bytes) << ")\n";
  }
  if (options.dry_run) {
    std::cout << "Would remove " << report.unreferenced.size() << " cached repositories, freeing "
              << repo::format_size(report.total_bytes()) << "\n";
    return 0;
  }
  std::cout << "Removed " << report.removed << " cached repositories, freed "
            << repo::format_size(report.freed_bytes) << "\n";
  return report.failed == 0 ? 0 : 1;
}

int run_repo(const Context &context, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: aimgr repo "
                 "<init|add|remove|sync|update|verify|prune|list|sources|show|delete>\n";
    return 1;
  }
  const std::string sub = args[0];
  args.erase(args.begin());

  if (sub == "init") {
    return run_repo_init(context);
  }
  if (sub == "add") {
    return run_repo_add(context, std::move(args));
  }
  if (sub == "remove") {
    return run_repo_remove(context, std::move(args));
  }
  if (sub == "sync") {
    return run_repo_sync(context, std::move(args));
  }
  if (sub == "update") {
    return run_repo_update(context, std::move(args));
  }
  if (sub == "verify") {
    return run_repo_verify(context, std::move(args));
  }
  if (sub == "prune") {
    return run_repo_prune(context, std::move(args));
  }
  if (sub == "list") {
    return run_repo_list(context, std::move(args));
  }
  if (sub == "sources") {
    return run_repo_sources(context);
  }
  if (sub == "show") {
    return run_repo_show(context, args);
  }
  if (sub == "delete") {
    return run_repo_delete(context, args);
  }
  std::cerr << "Unknown repo command: " << sub << "\n";
  return 1;
}

common::Result<install::Installer> make_installer(const Context &context,
                                                  std::vector<std::string> &args) {
  auto explicit_targets = tools::parse_tool_list(take_options(args, "--target", ""));
  if (!explicit_targets.ok()) {
    return common::Result<install::Installer>::failure(explicit_targets.error());
  }
  auto defaults = tools::parse_tool_list(context.config.install.targets);
  if (!defaults.ok()) {
    return common::Result<install::Installer>::failure("invalid install.targets in config: " +
                                                       defaults.error());
  }
  std::string project_raw;
  std::filesystem::path project = std::filesystem::current_path();
  if (take_option(args, "--project", "-p", project_raw)) {
    project = common::expand_path(project_raw);
  }
  return install::Installer::for_project(project, explicit_targets.value(), defaults.value());
}

int run_install(const Context &context, std::vector<std::string> args) {
  auto installer = make_installer(context, args);
  if (!installer.ok()) {
    std::cerr << installer.error() << "\n";
    return 1;
  }
  if (!reject_unknown_flags(args)) {
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: aimgr install <type/name>... [--target TOOL]... [--project DIR]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  int exit_code = 0;
  for (const auto &arg : args) {
    auto ref = parse_reference(arg);
    if (!ref.ok()) {
      std::cerr << ref.error() << "\n";
      exit_code = 1;
      continue;
    }
    auto installed = installer.value().install(repository, ref.value().name, ref.value().type);
    if (!installed.ok()) {
      observability::record_error("install", arg + ": " + installed.error());
      std::cerr << arg << ": " << installed.error() << "\n";
      exit_code = 1;
      continue;
    }
    const auto &report = installed.value();
    if (!report.linked.empty()) {
      std::cout << "Installed " << arg << " -> " << join_tools(report.linked) << "\n";
    }
    if (!report.already_present.empty()) {
      std::cout << arg << " already present in " << join_tools(report.already_present) << "\n";
    }
    for (const auto &missing : report.missing) {
      std::cerr << "  warning: " << arg << " references missing " << missing << "\n";
    }
  }
  return exit_code;
}

int run_uninstall(const Context &context, std::vector<std::string> args) {
  auto installer = make_installer(context, args);
  if (!installer.ok()) {
    std::cerr << installer.error() << "\n";
    return 1;
  }
  if (!reject_unknown_flags(args)) {
    return 1;
  }
  if (args.empty()) {
    std::cerr << "usage: aimgr uninstall <type/name>... [--target TOOL]... [--project DIR]\n";
    return 1;
  }

  repo::Repository repository(context.repo_root);
  int exit_code = 0;
  for (const auto &arg : args) {
    auto ref = parse_reference(arg);
    if (!ref.ok()) {
      std::cerr << ref.error() << "\n";
      exit_code = 1;
      continue;
    }
    auto removed = installer.value().uninstall(repository, ref.value().name, ref.value().type);
    if (!removed.ok()) {
      observability::record_error("uninstall", arg + ": " + removed.error());
      std::cerr << arg << ": " << removed.error() << "\n";
      exit_code = 1;
      continue;
    }
    std::cout << "Uninstalled " << arg << " from " << join_tools(removed.value().removed) << "\n";
    for (const auto &warning : removed.value().warnings) {
      std::cerr << "  warning: " << warning << "\n";
    }
  }
  return exit_code;
}

int run_list(const Context &context, std::vector<std::string> args) {
  auto installer = make_installer(context, args);
  if (!installer.ok()) {
    std::cerr << installer.error() << "\n";
    return 1;
  }

  const auto installed = installer.value().list();
  if (installed.empty()) {
    std::cout << "No resources installed\n";
    return 0;
  }
  for (const auto &entry : installed) {
    std::cout << ref_string(entry.type, entry.name) << "  [" << join_tools(entry.tools) << "]";
    if (entry.health == install::Health::Broken) {
      std::cout << "  broken: " << entry.path.string();
    } else if (!entry.description.empty()) {
      std::cout << "  " << entry.description;
    }
    std::cout << "\n";
  }
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: aimgr [--config PATH] [--verbose] <command> [options]\n\n";
  std::cout << "Repository:\n";
  std::cout << "  repo init                     Create the resource repository\n";
  std::cout << "  repo add <source>             Register a source and import its resources\n";
  std::cout << "      [--force|--skip-existing] [--dry-run] [--name NAME]\n";
  std::cout << "  repo remove <name|path|url>   Unregister a source and remove its resources\n";
  std::cout << "      [--dry-run] [--keep-resources]\n";
  std::cout << "  repo sync                     Re-import every source, drop vanished resources\n";
  std::cout << "      [--skip-existing] [--dry-run]\n";
  std::cout << "  repo update [type/name...]    Refresh resources from their sources [--dry-run]\n";
  std::cout << "  repo verify [--fix]           Check metadata and package references\n";
  std::cout << "  repo prune [--dry-run]        Delete workspace clones no source uses\n";
  std::cout << "  repo list [--type TYPE]       List stored resources\n";
  std::cout << "  repo sources                  List configured sources\n";
  std::cout << "  repo show <type/name>         Show a resource and its provenance\n";
  std::cout << "  repo delete <type/name>...    Delete resources from the repository\n\n";
  std::cout << "Project:\n";
  std::cout << "  install <type/name>...        Link resources into tool directories\n";
  std::cout << "  uninstall <type/name>...      Remove installed links\n";
  std::cout << "  list                          List installed resources\n";
  std::cout << "      [--target TOOL]... [--project DIR]\n\n";
  std::cout << "Other:\n";
  std::cout << "  config-path                   Print the config file location\n";
  std::cout << "  version                       Show version\n";
  std::cout << "  help                          Show this help\n\n";
  std::cout << "Tools: " << tools::valid_tool_names() << "\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  bool verbose = false;
  std::string global_error;
  if (!apply_global_options(args, verbose, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  if (subcommand != "repo" && subcommand != "install" && subcommand != "uninstall" &&
      subcommand != "list") {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return 1;
  }

  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  install_observer(context.value().config, verbose);

  if (subcommand == "repo") {
    return run_repo(context.value(), std::move(args));
  }
  if (subcommand == "install") {
    return run_install(context.value(), std::move(args));
  }
  if (subcommand == "uninstall") {
    return run_uninstall(context.value(), std::move(args));
  }
  return run_list(context.value(), std::move(args));
}

} // namespace aimgr::cli
