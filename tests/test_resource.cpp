#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "aimgr/resource/frontmatter.hpp"
#include "aimgr/resource/kind.hpp"
#include "aimgr/resource/types.hpp"

#include <algorithm>
#include <filesystem>

void register_resource_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  using aimgr::testing::TempWorkspace;
  namespace res = aimgr::resource;

  tests.push_back({"resource_type_parsing_accepts_plurals", [] {
                     require(res::parse_resource_type("skills") == res::ResourceType::Skill,
                             "plural");
                     require(res::parse_resource_type(" Command ") == res::ResourceType::Command,
                             "case and whitespace");
                     require(!res::parse_resource_type("widget").has_value(), "unknown type");
                     require(res::resource_type_dir(res::ResourceType::Agent) == "agents", "dir");
                   }});

  tests.push_back({"resource_name_validation_rules", [] {
                     require(res::validate_resource_name("deploy-app", false).ok(), "simple");
                     require(res::validate_resource_name("api/deploy", true).ok(), "nested");
                     require(!res::validate_resource_name("api/deploy", false).ok(),
                             "nested rejected for skills");
                     require(!res::validate_resource_name("Deploy", false).ok(), "uppercase");
                     require(!res::validate_resource_name("-deploy", false).ok(), "leading dash");
                     require(!res::validate_resource_name("a--b", false).ok(), "double dash");
                     require(!res::validate_resource_name("api//x", true).ok(), "empty segment");
                     require(!res::validate_resource_name(std::string(65, 'a'), false).ok(),
                             "segment too long");
                     require(res::validate_resource_name(std::string(64, 'a'), false).ok(),
                             "64 characters is allowed");
                   }});

  tests.push_back({"resource_reference_parsing", [] {
                     const auto ref = res::parse_resource_reference("command/api/deploy");
                     require(ref.ok(), ref.error());
                     require(ref.value().type == res::ResourceType::Command &&
                                 ref.value().name == "api/deploy",
                             "nested reference");
                     require(!res::parse_resource_reference("deploy").ok(), "missing type");
                     require(!res::parse_resource_reference("package/x").ok(),
                             "packages cannot nest packages");
                     require(!res::parse_resource_reference("skill/").ok(), "empty name");
                   }});

  tests.push_back({"resource_frontmatter_scalars_and_lists", [] {
                     const auto fm = res::parse_frontmatter(
                         "---\ndescription: Deploy things\ntools:\n  - bash\n  - git\n---\nBody\n");
                     require(fm.ok(), fm.error());
                     require(fm.value().present, "frontmatter present");
                     require(fm.value().get("description") == "Deploy things", "scalar");
                     require(fm.value().get("tools") == "bash, git", "list joined");
                     require(fm.value().lists.at("tools").size() == 2, "list kept");
                     require(fm.value().body == "Body\n", "body follows block");
                   }});

  tests.push_back({"resource_frontmatter_absent_and_unterminated", [] {
                     const auto plain = res::parse_frontmatter("# Title\n");
                     require(plain.ok() && !plain.value().present, "no frontmatter is fine");
                     require(!res::parse_frontmatter("---\ndescription: x\n").ok(),
                             "unterminated block fails");
                     require(!res::parse_frontmatter("---\n- a\n- b\n---\n").ok(),
                             "non-mapping block fails");
                   }});

  tests.push_back({"resource_detect_type_rules", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_skill(ws.path(), "skills/pdf", "Read PDFs");
                     aimgr::testing::make_command(ws.path(), "commands/api/deploy.md", "Deploy");
                     aimgr::testing::make_command(ws.path(), "agents/reviewer.md", "Review");
                     ws.create_file("loose/helper.md", aimgr::testing::markdown_resource(
                                                           "Helps", "instructions: be nice"));
                     ws.create_file("loose/plain.md", aimgr::testing::markdown_resource("Plain"));
                     ws.create_file("bundle.package.json", R"({"name": "bundle"})");
                     ws.create_file("notes.txt", "x");

                     const auto &root = ws.path();
                     require(res::detect_type(root / "skills/pdf").value() ==
                                 res::ResourceType::Skill,
                             "skill dir");
                     require(res::detect_type(root / "commands/api/deploy.md").value() ==
                                 res::ResourceType::Command,
                             "commands ancestor");
                     require(res::detect_type(root / "agents/reviewer.md").value() ==
                                 res::ResourceType::Agent,
                             "agents ancestor");
                     require(res::detect_type(root / "loose/helper.md").value() ==
                                 res::ResourceType::Agent,
                             "agent frontmatter");
                     require(res::detect_type(root / "loose/plain.md").value() ==
                                 res::ResourceType::Command,
                             "plain markdown is a command");
                     require(res::detect_type(root / "bundle.package.json").value() ==
                                 res::ResourceType::Package,
                             "package file");
                     require(!res::detect_type(root / "notes.txt").ok(), "unsupported file");
                     require(!res::detect_type(root / "loose").ok(), "plain directory");
                   }});

  tests.push_back({"resource_command_load_uses_nested_name", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_command(ws.path(), "commands/api/deploy.md",
                                                  "Deploy the API");
                     const auto loaded = res::load_resource(ws.path() / "commands/api/deploy.md");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().name == "api/deploy", loaded.value().name);
                     require(loaded.value().description == "Deploy the API", "description");
                     require(res::kind_for(res::ResourceType::Command).validate(loaded.value()).ok(),
                             "nested command is valid");
                   }});

  tests.push_back({"resource_validate_requires_description", [] {
                     TempWorkspace ws;
                     ws.create_file("commands/empty.md", "---\nauthor: me\n---\n");
                     const auto loaded = res::load_resource(ws.path() / "commands/empty.md");
                     require(loaded.ok(), loaded.error());
                     const auto status =
                         res::kind_for(res::ResourceType::Command).validate(loaded.value());
                     require(!status.ok(), "missing description should fail");
                     require(status.error().starts_with("invalid command"), status.error());
                   }});

  tests.push_back({"resource_skill_name_must_match_directory", [] {
                     TempWorkspace ws;
                     ws.create_file("skills/pdf/SKILL.md",
                                    "---\nname: pdf-reader\ndescription: Reads\n---\n");
                     const auto loaded = res::load_resource(ws.path() / "skills/pdf");
                     require(loaded.ok(), loaded.error());
                     const auto status =
                         res::kind_for(res::ResourceType::Skill).validate(loaded.value());
                     require(!status.ok(), "mismatched skill name should fail");
                     require(status.error().find("does not match directory name") !=
                                 std::string::npos,
                             status.error());
                   }});

  tests.push_back({"resource_skill_description_length_limit", [] {
                     TempWorkspace ws;
                     aimgr::testing::make_skill(ws.path(), "skills/long", std::string(1025, 'x'));
                     const auto loaded = res::load_resource(ws.path() / "skills/long");
                     require(loaded.ok(), loaded.error());
                     require(!res::kind_for(res::ResourceType::Skill).validate(loaded.value()).ok(),
                             "1025 character description should fail");
                   }});

  tests.push_back({"resource_package_load_and_validate", [] {
                     TempWorkspace ws;
                     ws.create_file("web.package.json", R"({
  "name": "web",
  "description": "Web tooling",
  "resources": ["command/build", "skill/lint"]
})");
                     ws.create_file("bad.package.json", R"({
  "name": "bad",
  "description": "Broken",
  "resources": ["build"]
})");
                     const auto web = res::load_resource(ws.path() / "web.package.json");
                     require(web.ok(), web.error());
                     require(web.value().references.size() == 2, "references loaded");
                     require(res::kind_for(res::ResourceType::Package).validate(web.value()).ok(),
                             "valid package");

                     const auto bad = res::load_resource(ws.path() / "bad.package.json");
                     require(bad.ok(), bad.error());
                     require(!res::kind_for(res::ResourceType::Package).validate(bad.value()).ok(),
                             "bad reference should fail validation");
                   }});

  tests.push_back({"resource_package_json_round_trip", [] {
                     TempWorkspace ws;
                     res::Resource package{.type = res::ResourceType::Package,
                                           .name = "tools",
                                           .description = "Tool \"set\"",
                                           .references = {"agent/reviewer"}};
                     ws.create_file("tools.package.json", res::package_to_json(package));
                     const auto loaded = res::load_resource(ws.path() / "tools.package.json");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().description == "Tool \"set\"", "escaped description");
                     require(loaded.value().references == package.references, "references");
                   }});

  tests.push_back({"resource_store_copy_and_symlink", [] {
                     TempWorkspace ws;
                     const auto repo = ws.path() / "repo";
                     aimgr::testing::make_skill(ws.path(), "src/skills/pdf", "Read PDFs");
                     aimgr::testing::make_command(ws.path(), "src/commands/build.md", "Build");

                     const auto skill = res::load_resource(ws.path() / "src/skills/pdf");
                     const auto command = res::load_resource(ws.path() / "src/commands/build.md");
                     require(skill.ok() && command.ok(), "sources load");

                     const auto &skill_kind = res::kind_for(res::ResourceType::Skill);
                     require(skill_kind.store(skill.value(), repo, res::ImportMode::Copy).ok(),
                             "copy store");
                     require(std::filesystem::is_regular_file(repo / "skills/pdf/SKILL.md"),
                             "skill copied");
                     require(!std::filesystem::is_symlink(repo / "skills/pdf"), "copy is real");

                     const auto &command_kind = res::kind_for(res::ResourceType::Command);
                     require(
                         command_kind.store(command.value(), repo, res::ImportMode::Symlink).ok(),
                         "symlink store");
                     require(std::filesystem::is_symlink(repo / "commands/build.md"),
                             "command linked");

                     require(!command_kind.store(command.value(), repo, res::ImportMode::Copy).ok(),
                             "existing destination is refused");
                   }});

  tests.push_back({"resource_scan_lists_nested_and_dangling", [] {
                     TempWorkspace ws;
                     const auto repo = ws.path();
                     aimgr::testing::make_command(repo, "commands/api/deploy.md", "Deploy");
                     aimgr::testing::make_command(repo, "commands/build.md", "Build");
                     aimgr::testing::make_command(repo, "commands/.hidden/x.md", "Hidden");
                     std::filesystem::create_symlink(repo / "gone.md", repo / "commands/lost.md");

                     auto entries = res::kind_for(res::ResourceType::Command).scan(repo);
                     std::vector<std::string> names;
                     for (const auto &entry : entries) {
                       names.push_back(entry.name);
                     }
                     std::sort(names.begin(), names.end());
                     require(names == std::vector<std::string>{"api/deploy", "build", "lost"},
                             "scan names");
                   }});

  tests.push_back({"resource_link_names", [] {
                     const auto &command = res::kind_for(res::ResourceType::Command);
                     const auto &skill = res::kind_for(res::ResourceType::Skill);
                     require(command.link_name("api/deploy") == "api/deploy.md", "command link");
                     require(command.name_from_link("api/deploy.md") == "api/deploy",
                             "command name from link");
                     require(skill.link_name("pdf") == "pdf", "skill link");
                     require(skill.name_from_link("pdf") == "pdf", "skill name from link");
                   }});
}
