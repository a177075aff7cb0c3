#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "aimgr/manifest/manifest.hpp"
#include "aimgr/manifest/source_state.hpp"
#include "aimgr/metadata/store.hpp"
#include "aimgr/repo/repository.hpp"
#include "aimgr/repo/sources.hpp"
#include "aimgr/repo/sync.hpp"
#include "aimgr/workspace/cache.hpp"

#include <filesystem>

namespace {

using aimgr::resource::ResourceType;

std::size_t metadata_count(const std::filesystem::path &root) {
  std::size_t count = 0;
  for (const auto type : aimgr::resource::ALL_RESOURCE_TYPES) {
    count += aimgr::metadata::list(root, type).size();
  }
  return count;
}

void make_pack(const std::filesystem::path &dir) {
  aimgr::testing::make_command(dir, "commands/build.md", "Build");
  aimgr::testing::make_command(dir, "commands/test.md", "Test");
  aimgr::testing::make_skill(dir, "skills/review", "Review code");
}

} // namespace

void register_sources_sync_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  using aimgr::testing::TempWorkspace;
  namespace repo = aimgr::repo;
  namespace manifest = aimgr::manifest;

  tests.push_back({"sources_add_and_remove_local_pack", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     const auto added = repo::add_source(repository, cache,
                                                         (ws.path() / "pack").string(), {});
                     require(added.ok(), added.error());
                     const auto &report = added.value();
                     require(report.discovered.summary() ==
                                 "Found: 2 commands, 1 skills, 0 agents, 0 packages",
                             report.discovered.summary());
                     require(report.import.added.size() == 3, report.import.summary());
                     require(report.source.name == "pack", report.source.name);
                     require(report.source.id.starts_with("src-"), report.source.id);

                     const auto document = manifest::Manifest::load(repository.root());
                     require(document.ok() && document.value().sources().size() == 1,
                             "source registered");
                     require(metadata_count(repository.root()) == 3, "metadata written");
                     const auto record = repository.metadata("review", ResourceType::Skill);
                     require(record.ok() && record.value().source_type == "local",
                             "local source type");

                     const auto listed = repo::list_sources(repository);
                     require(listed.ok() && listed.value().size() == 1, "one listing");
                     require(!listed.value()[0].state.added.empty(), "added timestamp recorded");

                     const auto removed = repo::remove_source(repository, "pack", {});
                     require(removed.ok(), removed.error());
                     require(removed.value().removed.size() == 3, "resources removed");
                     require(metadata_count(repository.root()) == 0, "no metadata left");
                     require(!repository.resource_exists("build", ResourceType::Command),
                             "command removed");
                     const auto after = manifest::Manifest::load(repository.root());
                     require(after.ok() && after.value().sources().empty(), "manifest empty");
                     const auto state = manifest::SourceState::load(repository.root());
                     require(state.ok() && state.value().get("pack") == nullptr, "state erased");
                   }});

  tests.push_back({"sources_command_under_nested_agents_dir_stays_a_command", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_command(ws.path() / "pack", "commands/agents/foo.md",
                                                  "Foo helper");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     const auto added = repo::add_source(repository, cache,
                                                         (ws.path() / "pack").string(), {});
                     require(added.ok(), added.error());
                     const auto &report = added.value();
                     require(report.discovered.summary() ==
                                 "Found: 1 commands, 0 skills, 0 agents, 0 packages",
                             report.discovered.summary());
                     require(report.import.status().ok(), report.import.status().error());
                     require(report.import.added.size() == 1 && report.import.failed.empty(),
                             report.import.summary());
                     require(repository.resource_exists("agents/foo", ResourceType::Command),
                             "stored as nested command");
                     require(!repository.resource_exists("foo", ResourceType::Agent),
                             "not claimed as an agent");

                     for (int i = 0; i < 2; ++i) {
                       const auto synced = repo::SyncReconciler(repository, cache).sync({});
                       require(synced.status.ok(), synced.status.error());
                       require(synced.removed.empty(), synced.summary());
                     }
                     require(repository.resource_exists("agents/foo", ResourceType::Command),
                             "still present after sync");
                   }});

  tests.push_back({"sources_custom_name_is_recorded_in_metadata", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack-dir");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     repo::AddSourceOptions options;
                     options.name = "team-tools";
                     const auto added = repo::add_source(
                         repository, cache, (ws.path() / "pack-dir").string(), options);
                     require(added.ok(), added.error());
                     const auto record = repository.metadata("build", ResourceType::Command);
                     require(record.ok() && record.value().source_name == "team-tools",
                             "custom name recorded");

                     repo::SyncReconciler reconciler(repository, cache);
                     const auto synced = reconciler.sync({});
                     require(synced.status.ok(), synced.status.error());
                     const auto after = repository.metadata("build", ResourceType::Command);
                     require(after.ok() && after.value().source_name == "team-tools",
                             "name survives sync");
                     require(after.value().first_installed == record.value().first_installed,
                             "first_installed survives sync");

                     const auto removed = repo::remove_source(repository, "team-tools", {});
                     require(removed.ok() && removed.value().removed.size() == 3,
                             "removal by custom name");
                   }});

  tests.push_back({"sources_add_conflict_still_registers", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "one");
                     make_pack(ws.path() / "two");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "one").string(), {})
                                 .ok(),
                             "first source");

                     const auto second =
                         repo::add_source(repository, cache, (ws.path() / "two").string(), {});
                     require(second.ok(), second.error());
                     require(second.value().import.failed.size() == 3, "conflicts reported");
                     require(!second.value().import.status().ok(), "batch status is an error");
                     const auto document = manifest::Manifest::load(repository.root());
                     require(document.ok() && document.value().sources().size() == 2,
                             "second source registered");
                   }});

  tests.push_back({"sources_add_rejects_force_with_skip_and_duplicates", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     repo::AddSourceOptions both;
                     both.force = true;
                     both.skip_existing = true;
                     require(!repo::add_source(repository, cache, (ws.path() / "pack").string(),
                                               both)
                                  .ok(),
                             "exclusive policies");

                     require(repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                 .ok(),
                             "first add");
                     require(!repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                  .ok(),
                             "same location twice");
                     require(!repo::add_source(repository, cache,
                                               (ws.path() / "missing").string(), {})
                                  .ok(),
                             "missing directory");
                   }});

  tests.push_back({"sources_add_dry_run_writes_nothing", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     require(repository.init().ok(), "init");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     const auto before = aimgr::testing::snapshot_tree(repository.root());
                     repo::AddSourceOptions options;
                     options.dry_run = true;
                     const auto added = repo::add_source(repository, cache,
                                                         (ws.path() / "pack").string(), options);
                     require(added.ok(), added.error());
                     require(added.value().import.added.size() == 3, "preview counts");
                     require(aimgr::testing::snapshot_tree(repository.root()) == before,
                             "repository unchanged");
                   }});

  tests.push_back({"sources_remove_keep_resources_and_dry_run", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                 .ok(),
                             "add");

                     repo::RemoveSourceOptions dry;
                     dry.dry_run = true;
                     const auto preview = repo::remove_source(repository, "pack", dry);
                     require(preview.ok() && preview.value().removed.size() == 3, "preview");
                     require(metadata_count(repository.root()) == 3, "nothing removed");

                     repo::RemoveSourceOptions keep;
                     keep.keep_resources = true;
                     const auto kept = repo::remove_source(repository, "pack", keep);
                     require(kept.ok() && kept.value().removed.empty(), "resources kept");
                     require(repository.resource_exists("build", ResourceType::Command),
                             "command still stored");
                     require(!repo::remove_source(repository, "pack", {}).ok(),
                             "source already gone");
                   }});

  tests.push_back({"sync_without_sources_fails", [] {
                     TempWorkspace ws;
                     repo::Repository repository(ws.path() / "repo");
                     require(repository.init().ok(), "init");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(!report.status.ok(), "no sources");
                     require(report.status.error().find("no sync sources configured") !=
                                 std::string::npos,
                             report.status.error());
                   }});

  tests.push_back({"sync_continues_past_unavailable_source", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "good");
                     aimgr::testing::make_command(ws.path() / "bad", "commands/lost.md", "Lost");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "good").string(), {})
                                 .ok(),
                             "good source");
                     require(repo::add_source(repository, cache, (ws.path() / "bad").string(), {})
                                 .ok(),
                             "bad source");
                     std::filesystem::remove_all(ws.path() / "bad");

                     aimgr::testing::ObserverCapture capture;
                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(report.status.ok(), "partial failure is not fatal");
                     require(report.sources.size() == 2, "both sources reported");
                     require(report.synced_count() == 1 && report.failed_count() == 1, "counts");
                     require(report.sources[1].error.starts_with("source unavailable:"),
                             report.sources[1].error);
                     require(report.summary() ==
                                 "Sync Complete: 1/2 sources synced, 0 resource(s) removed",
                             report.summary());
                     require(repository.resource_exists("lost", ResourceType::Command),
                             "failed source keeps its resources");

                     const auto state = manifest::SourceState::load(repository.root());
                     require(state.ok(), "state readable");
                     require(!state.value().get("good")->last_synced.empty(), "good synced");
                     const auto *bad = state.value().get("bad");
                     require(bad == nullptr || bad->last_synced.empty(), "bad not synced");
                     require(capture.metrics_of<aimgr::observability::SyncDurationMetric>()
                                     .front()
                                     .failed == 1,
                             "duration metric");
                   }});

  tests.push_back({"sync_fails_when_every_source_fails", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                 .ok(),
                             "add");
                     std::filesystem::remove_all(ws.path() / "pack");
                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(!report.status.ok(), "all failed");
                     require(report.status.error() == "all sources failed to sync",
                             report.status.error());
                     require(metadata_count(repository.root()) == 3, "nothing removed");
                   }});

  tests.push_back({"sync_removes_resources_gone_from_source", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                 .ok(),
                             "add");
                     std::filesystem::remove(ws.path() / "pack/commands/test.md");
                     aimgr::testing::make_command(ws.path() / "pack", "commands/build.md",
                                                  "Build v2");

                     repo::SyncOptions dry;
                     dry.dry_run = true;
                     const auto preview = repo::SyncReconciler(repository, cache).sync(dry);
                     require(preview.status.ok(), preview.status.error());
                     require(preview.removed.size() == 1, "removal previewed");
                     require(repository.resource_exists("test", ResourceType::Command),
                             "dry run keeps resource");
                     require(preview.summary() ==
                                 "Sync Complete: 1/1 sources synced, 0 resource(s) removed",
                             preview.summary());

                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(report.status.ok(), report.status.error());
                     require(report.removed.size() == 1 && report.removed[0].name == "test",
                             "removed resource reported");
                     require(report.removed[0].source_name == "pack", "attributed to source");
                     require(!repository.resource_exists("test", ResourceType::Command),
                             "resource removed");
                     require(!aimgr::metadata::exists(repository.root(), "test",
                                                      ResourceType::Command),
                             "metadata removed");
                     const auto build = repository.get("build", ResourceType::Command);
                     require(build.ok() && build.value().description == "Build v2",
                             "changed resource refreshed");
                   }});

  tests.push_back({"sync_skip_existing_only_adds_new_resources", [] {
                     TempWorkspace ws;
                     make_pack(ws.path() / "pack");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "pack").string(), {})
                                 .ok(),
                             "add");
                     aimgr::testing::make_command(ws.path() / "pack", "commands/extra.md",
                                                  "Extra");
                     const auto before = repository.metadata("build", ResourceType::Command);
                     repo::SyncOptions options;
                     options.skip_existing = true;
                     const auto report = repo::SyncReconciler(repository, cache).sync(options);
                     require(report.status.ok(), report.status.error());
                     require(report.sources[0].import.skipped.size() == 3, "existing skipped");
                     require(report.sources[0].import.added.size() == 1, "new one added");
                     const auto after = repository.metadata("build", ResourceType::Command);
                     require(after.ok() && after.value().last_updated == before.value().last_updated,
                             "skipped metadata untouched");
                   }});

  tests.push_back({"sync_leaves_resources_claimed_by_another_source", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_command(ws.path() / "first", "commands/shared.md", "One");
                     aimgr::testing::make_command(ws.path() / "second", "commands/shared.md",
                                                  "Two");
                     aimgr::testing::make_command(ws.path() / "second", "commands/own.md", "Own");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "first").string(), {})
                                 .ok(),
                             "first");
                     repo::AddSourceOptions force;
                     force.force = true;
                     require(repo::add_source(repository, cache, (ws.path() / "second").string(),
                                              force)
                                 .ok(),
                             "second takes over shared");
                     std::filesystem::remove(ws.path() / "first/commands/shared.md");
                     aimgr::testing::make_command(ws.path() / "first", "commands/other.md", "O");

                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(report.status.ok(), report.status.error());
                     require(report.removed.empty(), "shared resource not removed");
                     const auto shared = repository.metadata("shared", ResourceType::Command);
                     require(shared.ok() && shared.value().source_name == "second", "owner");
                   }});

  tests.push_back({"sync_dry_run_preview_matches_takeover_by_later_source", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_command(ws.path() / "first", "commands/shared.md", "One");
                     aimgr::testing::make_command(ws.path() / "second", "commands/shared.md",
                                                  "Two");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());
                     require(repo::add_source(repository, cache, (ws.path() / "first").string(), {})
                                 .ok(),
                             "first");
                     repo::AddSourceOptions skip;
                     skip.skip_existing = true;
                     require(repo::add_source(repository, cache, (ws.path() / "second").string(),
                                              skip)
                                 .ok(),
                             "second registered without taking shared");
                     std::filesystem::remove(ws.path() / "first/commands/shared.md");
                     aimgr::testing::make_command(ws.path() / "first", "commands/other.md", "O");

                     repo::SyncOptions dry;
                     dry.dry_run = true;
                     const auto preview = repo::SyncReconciler(repository, cache).sync(dry);
                     require(preview.status.ok(), preview.status.error());
                     require(preview.removed.empty(), "second source takes shared over");

                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(report.removed.size() == preview.removed.size(),
                             "preview agrees with the real run");
                     const auto shared = repository.metadata("shared", ResourceType::Command);
                     require(shared.ok() && shared.value().source_name == "second", "new owner");
                   }});

  tests.push_back({"sync_clones_git_remote_into_workspace", [] {
                     if (!aimgr::testing::git_available()) {
                       return;
                     }
                     TempWorkspace ws;
                     make_pack(ws.path() / "remote");
                     aimgr::testing::git_commit_all(ws.path() / "remote", "initial");
                     repo::Repository repository(ws.path() / "repo");
                     aimgr::workspace::WorkspaceCache cache(repository.root());

                     const std::string url = "file://" + (ws.path() / "remote").string();
                     const auto added = repo::add_source(repository, cache, url, {});
                     require(added.ok(), added.error());
                     require(added.value().source.is_remote(), "remote source");
                     require(added.value().resolved_dir.string().starts_with(cache.dir().string()),
                             "checkout lives in the workspace cache");
                     require(added.value().import.added.size() == 3, added.value().import.summary());

                     std::filesystem::remove(ws.path() / "remote/commands/test.md");
                     aimgr::testing::git_commit_all(ws.path() / "remote", "drop test");
                     const auto report = repo::SyncReconciler(repository, cache).sync({});
                     require(report.status.ok(), report.status.error());
                     require(report.removed.size() == 1, "pulled removal");
                     require(!repository.resource_exists("test", ResourceType::Command),
                             "test removed after pull");
                   }});
}
