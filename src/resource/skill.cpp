#include "aimgr/common/fs.hpp"
#include "aimgr/resource/frontmatter.hpp"
#include "aimgr/resource/kind.hpp"

namespace aimgr::resource {

common::Result<Resource> SkillKind::load(const std::filesystem::path &path) const {
  const auto dir = common::absolute_path(path);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return common::Result<Resource>::failure("skill must be a directory: " + path.string());
  }
  const auto manifest = dir / "SKILL.md";
  if (!std::filesystem::is_regular_file(manifest, ec)) {
    return common::Result<Resource>::failure("skill directory has no SKILL.md: " +
                                             path.string());
  }

  auto fm = read_frontmatter(manifest);
  if (!fm.ok()) {
    return common::Result<Resource>::failure("failed to load skill " + path.string() + ": " +
                                             fm.error());
  }

  Resource resource{
      .type = ResourceType::Skill,
      .name = dir.filename().string(),
      .description = fm.value().get("description"),
      .version = fm.value().get("version"),
      .author = fm.value().get("author"),
      .license = fm.value().get("license"),
      .path = path,
      .fields = fm.value().values,
  };
  return common::Result<Resource>::success(std::move(resource));
}

common::Status SkillKind::validate(const Resource &resource) const {
  auto base = ResourceKind::validate(resource);
  if (!base.ok()) {
    return base;
  }
  const auto declared = resource.fields.find("name");
  if (declared != resource.fields.end() && declared->second != resource.name) {
    return common::Status::error("invalid skill '" + resource.name + "': name '" +
                                 declared->second + "' does not match directory name");
  }
  return common::Status::success();
}

std::filesystem::path SkillKind::store_path(const std::filesystem::path &repo_root,
                                            const std::string &name) const {
  return repo_root / "skills" / name;
}

std::string SkillKind::link_name(const std::string &name) const { return name; }

std::vector<StoredEntry> SkillKind::scan(const std::filesystem::path &repo_root) const {
  std::vector<StoredEntry> entries;
  const auto dir = repo_root / "skills";
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return entries;
  }

  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.starts_with(".")) {
      continue;
    }
    // is_directory() follows symlinks; a dangling link is kept for orphan reporting.
    std::error_code status_ec;
    if (it->is_directory(status_ec) || it->is_symlink(status_ec)) {
      entries.push_back(StoredEntry{.name = name, .path = it->path()});
    }
  }
  return entries;
}

} // namespace aimgr::resource
