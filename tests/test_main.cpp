#include "test_framework.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>

void register_common_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_config_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_observability_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_resource_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_metadata_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_manifest_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_source_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_discovery_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_importer_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_repository_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_sources_sync_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_maintenance_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_tools_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_installer_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_cli_tests(std::vector<aimgr::tests::TestCase> &tests);
void register_workflow_integration_tests(std::vector<aimgr::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  // Repositories commit on every change; give git an identity that works anywhere.
  setenv("GIT_AUTHOR_NAME", "aimgr tests", 1);
  setenv("GIT_AUTHOR_EMAIL", "tests@aimgr.invalid", 1);
  setenv("GIT_COMMITTER_NAME", "aimgr tests", 1);
  setenv("GIT_COMMITTER_EMAIL", "tests@aimgr.invalid", 1);

  std::vector<aimgr::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_resource_tests(tests);
  register_metadata_tests(tests);
  register_manifest_tests(tests);
  register_source_tests(tests);
  register_discovery_tests(tests);
  register_importer_tests(tests);
  register_repository_tests(tests);
  register_sources_sync_tests(tests);
  register_maintenance_tests(tests);
  register_tools_tests(tests);
  register_installer_tests(tests);
  register_cli_tests(tests);
  register_workflow_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
