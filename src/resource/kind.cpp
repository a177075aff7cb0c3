#include "aimgr/resource/kind.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/resource/frontmatter.hpp"

namespace aimgr::resource {

std::string_view import_mode_to_string(const ImportMode mode) {
  return mode == ImportMode::Symlink ? "symlink" : "copy";
}

std::optional<ImportMode> parse_import_mode(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "symlink") {
    return ImportMode::Symlink;
  }
  if (normalized == "copy") {
    return ImportMode::Copy;
  }
  return std::nullopt;
}

common::Status ResourceKind::validate(const Resource &resource) const {
  auto name_status = validate_resource_name(resource.name, allows_nested_names());
  if (!name_status.ok()) {
    return common::Status::error("invalid " + std::string(resource_type_to_string(type())) +
                                 " name: " + name_status.error());
  }
  auto description_status = validate_description(type(), resource.description);
  if (!description_status.ok()) {
    return common::Status::error("invalid " + std::string(resource_type_to_string(type())) +
                                 " '" + resource.name + "': " + description_status.error());
  }
  return common::Status::success();
}

std::string ResourceKind::name_from_link(const std::filesystem::path &relative) const {
  std::string name = relative.generic_string();
  if (common::ends_with(name, ".md")) {
    name.resize(name.size() - 3);
  }
  return name;
}

common::Status ResourceKind::store(const Resource &resource,
                                   const std::filesystem::path &repo_root,
                                   const ImportMode mode) const {
  const auto dest = store_path(repo_root, resource.name);
  if (common::entry_exists(dest)) {
    return common::Status::error("destination already exists: " + dest.string());
  }
  auto ensured = common::ensure_dir(dest.parent_path());
  if (!ensured.ok()) {
    return common::Status::error(ensured.error());
  }

  if (mode == ImportMode::Copy) {
    return common::copy_tree(resource.path, dest);
  }

  const auto target = common::absolute_path(resource.path);
  std::error_code ec;
  if (std::filesystem::is_directory(target, ec)) {
    std::filesystem::create_directory_symlink(target, dest, ec);
  } else {
    std::filesystem::create_symlink(target, dest, ec);
  }
  if (ec) {
    return common::Status::error("failed to create symlink " + dest.string() + " -> " +
                                 target.string() + ": " + ec.message());
  }
  return common::Status::success();
}

std::string nested_markdown_name(const std::filesystem::path &path, const std::string &anchor) {
  const auto normal = path.lexically_normal();
  for (auto dir = normal.parent_path(); !dir.empty() && dir != dir.root_path();
       dir = dir.parent_path()) {
    if (dir.filename() == anchor) {
      std::string name = normal.lexically_relative(dir).generic_string();
      if (common::ends_with(name, ".md")) {
        name.resize(name.size() - 3);
      }
      return name;
    }
  }
  return normal.stem().string();
}

const ResourceKind &kind_for(const ResourceType type) {
  static const CommandKind command_kind;
  static const SkillKind skill_kind;
  static const AgentKind agent_kind;
  static const PackageKind package_kind;

  switch (type) {
  case ResourceType::Command:
    return command_kind;
  case ResourceType::Skill:
    return skill_kind;
  case ResourceType::Agent:
    return agent_kind;
  case ResourceType::Package:
    return package_kind;
  }
  return command_kind;
}

common::Result<ResourceType> detect_type(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<ResourceType>::failure("path does not exist: " + path.string());
  }

  if (std::filesystem::is_directory(path, ec)) {
    if (std::filesystem::is_regular_file(path / "SKILL.md", ec)) {
      return common::Result<ResourceType>::success(ResourceType::Skill);
    }
    return common::Result<ResourceType>::failure("directory is not a skill (missing SKILL.md): " +
                                                 path.string());
  }

  const std::string filename = path.filename().string();
  if (common::ends_with(filename, ".package.json")) {
    return common::Result<ResourceType>::success(ResourceType::Package);
  }
  if (path.extension() != ".md") {
    return common::Result<ResourceType>::failure("unsupported resource file: " + path.string());
  }

  const auto normal = common::absolute_path(path);
  for (auto dir = normal.parent_path(); !dir.empty() && dir != dir.root_path();
       dir = dir.parent_path()) {
    if (dir.filename() == "agents") {
      return common::Result<ResourceType>::success(ResourceType::Agent);
    }
    if (dir.filename() == "commands") {
      return common::Result<ResourceType>::success(ResourceType::Command);
    }
  }

  auto fm = read_frontmatter(path);
  if (fm.ok() && (fm.value().has("type") || fm.value().has("instructions") ||
                  fm.value().has("capabilities"))) {
    return common::Result<ResourceType>::success(ResourceType::Agent);
  }
  return common::Result<ResourceType>::success(ResourceType::Command);
}

common::Result<Resource> load_resource(const std::filesystem::path &path) {
  auto type = detect_type(path);
  if (!type.ok()) {
    return common::Result<Resource>::failure(type.error());
  }
  return kind_for(type.value()).load(path);
}

} // namespace aimgr::resource
