#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/hash.hpp"
#include "aimgr/common/json_util.hpp"
#include "aimgr/common/process.hpp"
#include "aimgr/common/toml.hpp"

#include <filesystem>

void register_common_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  namespace common = aimgr::common;
  using aimgr::testing::TempWorkspace;

  tests.push_back({"common_trim_and_split", [] {
                     require(common::trim("  a b \n") == "a b", "trim should strip both ends");
                     require(common::trim(" \t ").empty(), "blank trims to empty");
                     const auto parts = common::split("a,b,,c", ',');
                     require(parts.size() == 4, "split keeps empty fields");
                     require(parts[2].empty() && parts[3] == "c", "split fields");
                   }});

  tests.push_back({"common_expand_path_home_and_env", [] {
                     const aimgr::testing::EnvGuard home("HOME", "/home/tester");
                     const aimgr::testing::EnvGuard var("AIMGR_TEST_DIR", "data");
                     require(common::expand_path("~/x") == "/home/tester/x", "tilde expands");
                     require(common::expand_path("/srv/${AIMGR_TEST_DIR}/repo") == "/srv/data/repo",
                             "braced variable expands");
                     require(common::expand_path("/srv/$AIMGR_TEST_DIR") == "/srv/data",
                             "bare variable expands");
                   }});

  tests.push_back({"common_absolute_path_drops_trailing_separator", [] {
                     const auto path = common::absolute_path("/tmp/a/b/../c/");
                     require(path == std::filesystem::path("/tmp/a/c"), path.string());
                   }});

  tests.push_back({"common_write_file_replaces_atomically", [] {
                     TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "file.txt";
                     require(common::write_file(path, "one").ok(), "first write");
                     require(common::write_file(path, "two").ok(), "second write");
                     const auto content = common::read_file(path);
                     require(content.ok() && content.value() == "two", "content replaced");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temp file removed");
                   }});

  tests.push_back({"common_read_file_missing_is_failure", [] {
                     TempWorkspace ws;
                     const auto content = common::read_file(ws.path() / "missing");
                     require(!content.ok(), "missing file should fail");
                   }});

  tests.push_back({"common_copy_tree_copies_directories", [] {
                     TempWorkspace ws;
                     ws.create_file("src/a.txt", "a");
                     ws.create_file("src/sub/b.txt", "b");
                     require(common::copy_tree(ws.path() / "src", ws.path() / "dst").ok(),
                             "copy_tree should succeed");
                     require(aimgr::testing::read_file(ws.path() / "dst/sub/b.txt") == "b",
                             "nested file copied");
                   }});

  tests.push_back({"common_entry_exists_counts_dangling_links", [] {
                     TempWorkspace ws;
                     const auto link = ws.path() / "dangling";
                     std::filesystem::create_symlink(ws.path() / "nowhere", link);
                     require(common::entry_exists(link), "dangling link is an entry");
                     require(!std::filesystem::exists(link), "but its target does not exist");
                   }});

  tests.push_back({"common_now_rfc3339_format", [] {
                     const auto now = common::now_rfc3339();
                     require(now.size() >= 20, "timestamp too short: " + now);
                     require(now[4] == '-' && now[10] == 'T', "timestamp layout: " + now);
                   }});

  tests.push_back({"common_sha256_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc)");
                   }});

  tests.push_back({"common_json_members_and_accessors", [] {
                     const std::string json =
                         R"({"name": "a\"b", "count": 3, "nested": {"x": 1}, "list": ["p", "q"]})";
                     require(common::json_get_string(json, "name") == "a\"b", "string unescaped");
                     require(common::json_get_int(json, "count") == 3, "int field");
                     require(common::json_get_int(json, "missing", 7) == 7, "int fallback");
                     require(common::json_get_object(json, "nested") == R"({"x": 1})",
                             "object is raw text");
                     const auto list = common::json_get_string_array(json, "list");
                     require(list.size() == 2 && list[1] == "q", "string array");
                     require(common::json_string_array({"a", "b"}) == R"(["a", "b"])",
                             "array formatting");
                   }});

  tests.push_back({"common_json_escape_control_characters", [] {
                     const auto escaped = common::json_escape("line\n\"q\"\\");
                     require(escaped == "line\\n\\\"q\\\"\\\\", escaped);
                     require(common::json_unescape(escaped) == "line\n\"q\"\\", "unescape");
                   }});

  tests.push_back({"common_toml_sections_and_arrays", [] {
                     const auto parsed = common::parse_toml(R"(
[repo]
path = "/data/repo" # comment

[install]
targets = ["claude", "opencode"]
)");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get_string("repo.path") == "/data/repo", "string");
                     const auto targets = parsed.value().get_string_array("install.targets");
                     require(targets.size() == 2 && targets[1] == "opencode", "array");
                   }});

  tests.push_back({"common_shell_quote_escapes_single_quotes", [] {
                     require(common::shell_quote("it's") == "'it'\\''s'", "quoted");
                   }});

  tests.push_back({"common_run_capture_command_reports_exit_code", [] {
                     const auto ok = common::run_capture_command("echo hello");
                     require(ok.ok() && common::trim(ok.value()) == "hello", "echo output");
                     const auto failed = common::run_capture_command("exit 3");
                     require(!failed.ok(), "non-zero exit is a failure");
                     require(failed.error().find("exit code 3") != std::string::npos,
                             failed.error());
                   }});
}
