#include "test_framework.hpp"

#include "aimgr/source/parser.hpp"

void register_source_tests(std::vector<aimgr::tests::TestCase> &tests) {
  using aimgr::tests::require;
  namespace src = aimgr::source;

  tests.push_back({"source_parse_github_shorthand", [] {
                     const auto parsed = src::parse_source("gh:acme/tools@v1.2/resources/ai");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().kind == src::SourceKind::GitHub, "github kind");
                     require(parsed.value().ref == "v1.2", "ref");
                     require(parsed.value().subpath == "resources/ai", parsed.value().subpath);
                     require(parsed.value().clone_url() == "https://github.com/acme/tools",
                             parsed.value().clone_url());
                   }});

  tests.push_back({"source_parse_bare_owner_repo", [] {
                     const auto parsed = src::parse_source("acme/tools");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().url == "https://github.com/acme/tools",
                             parsed.value().url);
                     require(parsed.value().is_remote(), "remote");
                   }});

  tests.push_back({"source_parse_github_tree_url", [] {
                     const auto parsed =
                         src::parse_source("https://github.com/acme/tools/tree/main/skills/pdf");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().url == "https://github.com/acme/tools",
                             parsed.value().url);
                     require(parsed.value().ref == "main", "ref from tree url");
                     require(parsed.value().subpath == "skills/pdf", "subpath from tree url");
                   }});

  tests.push_back({"source_parse_other_remotes", [] {
                     const auto gitlab = src::parse_source("https://gitlab.com/acme/tools.git");
                     require(gitlab.ok() && gitlab.value().kind == src::SourceKind::GitLab,
                             "gitlab");
                     require(gitlab.value().url == "https://gitlab.com/acme/tools", "git suffix");

                     const auto ssh = src::parse_source("git@github.com:acme/tools.git");
                     require(ssh.ok() && ssh.value().kind == src::SourceKind::GitHub, "ssh");
                     require(ssh.value().url == "https://github.com/acme/tools", ssh.value().url);

                     const auto file = src::parse_source("file:///srv/repos/tools");
                     require(file.ok() && file.value().kind == src::SourceKind::GitUrl, "file");
                     require(file.value().clone_url() == "file:///srv/repos/tools", "file url");
                   }});

  tests.push_back({"source_parse_local_paths", [] {
                     const auto relative = src::parse_source("./my/resources/");
                     require(relative.ok(), relative.error());
                     require(relative.value().kind == src::SourceKind::Local, "local kind");
                     require(relative.value().local_path == "my/resources",
                             relative.value().local_path);
                     require(!relative.value().is_remote(), "not remote");

                     const auto absolute = src::parse_source("/srv/resources");
                     require(absolute.ok() && absolute.value().local_path == "/srv/resources",
                             "absolute path");
                     const auto prefixed = src::parse_source("local:/srv/x");
                     require(prefixed.ok() && prefixed.value().local_path == "/srv/x", "prefix");
                   }});

  tests.push_back({"source_parse_rejects_garbage", [] {
                     require(!src::parse_source("").ok(), "empty");
                     const auto bad = src::parse_source("not a source");
                     require(!bad.ok(), "unparseable");
                     require(bad.error().find("unable to parse source format") !=
                                 std::string::npos,
                             bad.error());
                     require(!src::parse_source("gh:onlyowner").ok(), "missing repo");
                   }});

  tests.push_back({"source_normalize_url", [] {
                     require(src::normalize_url(" https://GitHub.com/Acme/Tools.git/ ") ==
                                 "https://github.com/acme/tools",
                             "case, slash and suffix");
                     require(src::normalize_url("https://github.com/acme/tools.git") ==
                                 "https://github.com/acme/tools",
                             "git suffix dropped");
                   }});
}
