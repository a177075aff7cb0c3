#include "aimgr/common/fs.hpp"
#include "aimgr/resource/frontmatter.hpp"
#include "aimgr/resource/kind.hpp"

namespace aimgr::resource {

namespace {

// Markdown entries below `dir`, named by their relative path without ".md". Dangling
// symlinks are reported too so that the store listing can flag them.
std::vector<StoredEntry> scan_markdown_tree(const std::filesystem::path &dir) {
  std::vector<StoredEntry> entries;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return entries;
  }

  for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &entry = it->path();
    std::error_code entry_ec;
    if (entry.filename().string().starts_with(".")) {
      if (it->is_directory(entry_ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->is_directory(entry_ec) || entry.extension() != ".md") {
      continue;
    }
    std::string name = entry.lexically_relative(dir).generic_string();
    name.resize(name.size() - 3);
    entries.push_back(StoredEntry{.name = std::move(name), .path = entry});
  }
  return entries;
}

} // namespace

common::Result<Resource> load_markdown_resource(const std::filesystem::path &path,
                                                const ResourceType type,
                                                const std::string &anchor) {
  if (path.extension() != ".md") {
    return common::Result<Resource>::failure(std::string(resource_type_to_string(type)) +
                                             " must be a .md file: " + path.string());
  }
  auto fm = read_frontmatter(path);
  if (!fm.ok()) {
    return common::Result<Resource>::failure("failed to load " +
                                             std::string(resource_type_to_string(type)) + " " +
                                             path.string() + ": " + fm.error());
  }

  Resource resource{
      .type = type,
      .name = nested_markdown_name(path, anchor),
      .description = fm.value().get("description"),
      .version = fm.value().get("version"),
      .author = fm.value().get("author"),
      .license = fm.value().get("license"),
      .path = path,
      .fields = fm.value().values,
  };
  return common::Result<Resource>::success(std::move(resource));
}

common::Result<Resource> CommandKind::load(const std::filesystem::path &path) const {
  return load_markdown_resource(path, ResourceType::Command, "commands");
}

std::filesystem::path CommandKind::store_path(const std::filesystem::path &repo_root,
                                              const std::string &name) const {
  return repo_root / "commands" / (name + ".md");
}

std::string CommandKind::link_name(const std::string &name) const { return name + ".md"; }

std::vector<StoredEntry> CommandKind::scan(const std::filesystem::path &repo_root) const {
  return scan_markdown_tree(repo_root / "commands");
}

common::Result<Resource> AgentKind::load(const std::filesystem::path &path) const {
  return load_markdown_resource(path, ResourceType::Agent, "agents");
}

std::filesystem::path AgentKind::store_path(const std::filesystem::path &repo_root,
                                            const std::string &name) const {
  return repo_root / "agents" / (name + ".md");
}

std::string AgentKind::link_name(const std::string &name) const { return name + ".md"; }

std::vector<StoredEntry> AgentKind::scan(const std::filesystem::path &repo_root) const {
  return scan_markdown_tree(repo_root / "agents");
}

} // namespace aimgr::resource
