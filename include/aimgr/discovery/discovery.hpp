#pragma once

#include "aimgr/resource/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::discovery {

inline constexpr int MAX_SEARCH_DEPTH = 5;

struct Candidate {
  resource::ResourceType type = resource::ResourceType::Command;
  std::string name;
  std::filesystem::path path;
};

struct DiscoveryError {
  std::filesystem::path path;
  std::string message;
};

struct DiscoveryResult {
  std::vector<Candidate> candidates;
  std::vector<DiscoveryError> errors;
};

/// Finds resources of one kind inside a source directory. The conventional
/// locations (`commands/`, `.claude/commands/`, ...) are searched first; only when
/// they yield nothing is the tree searched recursively, to MAX_SEARCH_DEPTH, skipping
/// hidden and vendor directories. Candidates are valid, loadable resources,
/// deduplicated by name in discovery order. Never fails; problems are reported in
/// `errors`.
[[nodiscard]] DiscoveryResult discover(resource::ResourceType type,
                                       const std::filesystem::path &root,
                                       const std::string &subpath = "");

[[nodiscard]] DiscoveryResult discover_commands(const std::filesystem::path &root,
                                                const std::string &subpath = "");
[[nodiscard]] DiscoveryResult discover_skills(const std::filesystem::path &root,
                                              const std::string &subpath = "");
[[nodiscard]] DiscoveryResult discover_agents(const std::filesystem::path &root,
                                              const std::string &subpath = "");
[[nodiscard]] DiscoveryResult discover_packages(const std::filesystem::path &root,
                                                const std::string &subpath = "");

struct DiscoveredResources {
  DiscoveryResult commands;
  DiscoveryResult skills;
  DiscoveryResult agents;
  DiscoveryResult packages;

  [[nodiscard]] const DiscoveryResult &of(resource::ResourceType type) const;
  [[nodiscard]] std::vector<Candidate> all() const;
  [[nodiscard]] std::vector<DiscoveryError> errors() const;
  [[nodiscard]] std::size_t total() const;
  [[nodiscard]] std::string summary() const;
};

[[nodiscard]] DiscoveredResources discover_all(const std::filesystem::path &root,
                                               const std::string &subpath = "");

} // namespace aimgr::discovery
