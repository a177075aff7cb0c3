#include "aimgr/discovery/discovery.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/resource/kind.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <set>

namespace aimgr::discovery {

namespace {

using resource::ResourceType;

bool is_skipped_dir(const std::string &name) {
  static const std::set<std::string> skipped = {"node_modules", ".git", "vendor", "build",
                                                "dist"};
  return name.starts_with(".") || skipped.contains(name);
}

bool is_excluded_file(const std::string &filename) {
  const std::string lower = common::to_lower(filename);
  return lower == "readme.md" || lower == "skill.md" || lower == "reference.md";
}

bool is_skill_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  return std::filesystem::is_regular_file(dir / "SKILL.md", ec);
}

// Directory entries in name order, so that repeated scans agree.
std::vector<std::filesystem::path> sorted_entries(const std::filesystem::path &dir) {
  std::vector<std::filesystem::path> entries;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(it->path());
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

bool is_dir(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

// Visits the non-directory entries under `dir` down to MAX_SEARCH_DEPTH. Skill
// directories are not descended into unless `enter_skills` is set.
void walk_files(const std::filesystem::path &dir, const int depth, const bool enter_skills,
                const std::function<void(const std::filesystem::path &)> &visit) {
  if (depth > MAX_SEARCH_DEPTH) {
    return;
  }
  for (const auto &entry : sorted_entries(dir)) {
    if (is_dir(entry)) {
      if (is_skipped_dir(entry.filename().string()) || (!enter_skills && is_skill_dir(entry))) {
        continue;
      }
      walk_files(entry, depth + 1, enter_skills, visit);
      continue;
    }
    visit(entry);
  }
}

void add_candidate(DiscoveryResult &result, std::set<std::string> &seen,
                   const resource::Resource &loaded) {
  if (seen.insert(loaded.name).second) {
    result.candidates.push_back(
        Candidate{.type = loaded.type, .name = loaded.name, .path = loaded.path});
  }
}

// Loads and validates `path` as `type`. Failures are recorded when `report` is set.
void consider(DiscoveryResult &result, std::set<std::string> &seen, const ResourceType type,
              const std::filesystem::path &path, const bool report) {
  const auto &kind = resource::kind_for(type);
  auto loaded = kind.load(path);
  if (!loaded.ok()) {
    if (report) {
      result.errors.push_back(DiscoveryError{.path = path, .message = loaded.error()});
    }
    return;
  }
  auto valid = kind.validate(loaded.value());
  if (!valid.ok()) {
    if (report) {
      result.errors.push_back(DiscoveryError{.path = path, .message = valid.error()});
    }
    return;
  }
  add_candidate(result, seen, loaded.value());
}

bool resolve_search_root(const std::filesystem::path &root, const std::string &subpath,
                         std::filesystem::path &search_root, DiscoveryResult &result) {
  search_root = subpath.empty() ? root : root / subpath;
  if (!is_dir(search_root)) {
    result.errors.push_back(DiscoveryError{
        .path = search_root, .message = "path does not exist: " + search_root.string()});
    return false;
  }
  return true;
}

using PriorityDirs = std::array<const char *, 3>;

const PriorityDirs COMMAND_DIRS = {"commands", ".claude/commands", ".opencode/commands"};
const PriorityDirs AGENT_DIRS = {"agents", ".claude/agents", ".opencode/agents"};

bool is_under_any(const std::filesystem::path &file, const std::filesystem::path &search_root,
                  const PriorityDirs &dirs) {
  for (const char *dir : dirs) {
    if (common::is_subpath(file, search_root / dir)) {
      return true;
    }
  }
  return false;
}

// The fallback walk leaves the conventional directories of `other_dirs` alone; their
// files belong to the other kind even when a nested directory name suggests otherwise.
DiscoveryResult discover_markdown(const ResourceType type, const std::filesystem::path &root,
                                  const std::string &subpath, const PriorityDirs &priority_dirs,
                                  const PriorityDirs &other_dirs) {
  DiscoveryResult result;
  std::filesystem::path search_root;
  if (!resolve_search_root(root, subpath, search_root, result)) {
    return result;
  }

  std::set<std::string> seen;
  const auto visit_priority = [&](const std::filesystem::path &file) {
    if (file.extension() == ".md" && !is_excluded_file(file.filename().string())) {
      consider(result, seen, type, file, true);
    }
  };
  for (const char *dir : priority_dirs) {
    if (is_dir(search_root / dir)) {
      walk_files(search_root / dir, 0, false, visit_priority);
    }
  }
  if (!result.candidates.empty()) {
    return result;
  }

  walk_files(search_root, 0, false, [&](const std::filesystem::path &file) {
    if (file.extension() != ".md" || is_excluded_file(file.filename().string()) ||
        is_under_any(file, search_root, other_dirs)) {
      return;
    }
    auto detected = resource::detect_type(file);
    if (detected.ok() && detected.value() == type) {
      consider(result, seen, type, file, false);
    }
  });
  return result;
}

void find_skill_dirs(const std::filesystem::path &dir, const int depth,
                     std::vector<std::filesystem::path> &found) {
  if (depth >= MAX_SEARCH_DEPTH) {
    return;
  }
  for (const auto &entry : sorted_entries(dir)) {
    if (!is_dir(entry) || is_skipped_dir(entry.filename().string())) {
      continue;
    }
    if (is_skill_dir(entry)) {
      found.push_back(entry);
      continue;
    }
    find_skill_dirs(entry, depth + 1, found);
  }
}

} // namespace

DiscoveryResult discover_commands(const std::filesystem::path &root, const std::string &subpath) {
  return discover_markdown(ResourceType::Command, root, subpath, COMMAND_DIRS, AGENT_DIRS);
}

DiscoveryResult discover_agents(const std::filesystem::path &root, const std::string &subpath) {
  return discover_markdown(ResourceType::Agent, root, subpath, AGENT_DIRS, COMMAND_DIRS);
}

DiscoveryResult discover_skills(const std::filesystem::path &root, const std::string &subpath) {
  DiscoveryResult result;
  std::filesystem::path search_root;
  if (!resolve_search_root(root, subpath, search_root, result)) {
    return result;
  }

  std::set<std::string> seen;
  if (is_skill_dir(search_root)) {
    consider(result, seen, ResourceType::Skill, search_root, true);
    return result;
  }

  for (const char *location : {"skills", ".claude/skills", ".opencode/skills", ".github/skills"}) {
    const auto dir = search_root / location;
    if (!is_dir(dir)) {
      continue;
    }
    for (const auto &entry : sorted_entries(dir)) {
      if (is_dir(entry) && is_skill_dir(entry)) {
        consider(result, seen, ResourceType::Skill, entry, true);
      }
    }
  }
  if (!result.candidates.empty()) {
    return result;
  }

  std::vector<std::filesystem::path> found;
  find_skill_dirs(search_root, 0, found);
  for (const auto &dir : found) {
    consider(result, seen, ResourceType::Skill, dir, false);
  }
  return result;
}

DiscoveryResult discover_packages(const std::filesystem::path &root, const std::string &subpath) {
  DiscoveryResult result;
  std::filesystem::path search_root;
  if (!resolve_search_root(root, subpath, search_root, result)) {
    return result;
  }

  std::set<std::string> seen;
  const auto dir = search_root / "packages";
  if (!is_dir(dir)) {
    return result;
  }
  for (const auto &entry : sorted_entries(dir)) {
    if (!is_dir(entry) && common::ends_with(entry.filename().string(), ".package.json")) {
      consider(result, seen, ResourceType::Package, entry, true);
    }
  }
  return result;
}

DiscoveryResult discover(const resource::ResourceType type, const std::filesystem::path &root,
                         const std::string &subpath) {
  switch (type) {
  case ResourceType::Command:
    return discover_commands(root, subpath);
  case ResourceType::Skill:
    return discover_skills(root, subpath);
  case ResourceType::Agent:
    return discover_agents(root, subpath);
  case ResourceType::Package:
    return discover_packages(root, subpath);
  }
  return {};
}

const DiscoveryResult &DiscoveredResources::of(const resource::ResourceType type) const {
  switch (type) {
  case ResourceType::Command:
    return commands;
  case ResourceType::Skill:
    return skills;
  case ResourceType::Agent:
    return agents;
  case ResourceType::Package:
    return packages;
  }
  return commands;
}

std::vector<Candidate> DiscoveredResources::all() const {
  std::vector<Candidate> all;
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    const auto &candidates = of(type).candidates;
    all.insert(all.end(), candidates.begin(), candidates.end());
  }
  return all;
}

std::vector<DiscoveryError> DiscoveredResources::errors() const {
  std::vector<DiscoveryError> all;
  for (const auto type : resource::ALL_RESOURCE_TYPES) {
    const auto &errors = of(type).errors;
    all.insert(all.end(), errors.begin(), errors.end());
  }
  return all;
}

std::size_t DiscoveredResources::total() const {
  return commands.candidates.size() + skills.candidates.size() + agents.candidates.size() +
         packages.candidates.size();
}

std::string DiscoveredResources::summary() const {
  return "Found: " + std::to_string(commands.candidates.size()) + " commands, " +
         std::to_string(skills.candidates.size()) + " skills, " +
         std::to_string(agents.candidates.size()) + " agents, " +
         std::to_string(packages.candidates.size()) + " packages";
}

DiscoveredResources discover_all(const std::filesystem::path &root, const std::string &subpath) {
  DiscoveredResources found{
      .commands = discover_commands(root, subpath),
      .skills = discover_skills(root, subpath),
      .agents = discover_agents(root, subpath),
      .packages = discover_packages(root, subpath),
  };

  // A file is imported once, as the first kind that claimed it.
  std::set<std::filesystem::path> claimed;
  for (const auto &candidate : found.commands.candidates) {
    claimed.insert(candidate.path);
  }
  std::erase_if(found.agents.candidates,
                [&](const Candidate &candidate) { return claimed.contains(candidate.path); });
  return found;
}

} // namespace aimgr::discovery
