#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/resource/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aimgr::resource {

enum class ImportMode {
  Copy,
  Symlink,
};

[[nodiscard]] std::string_view import_mode_to_string(ImportMode mode);
[[nodiscard]] std::optional<ImportMode> parse_import_mode(const std::string &value);

struct StoredEntry {
  std::string name;
  std::filesystem::path path;
};

class ResourceKind {
public:
  virtual ~ResourceKind() = default;

  [[nodiscard]] virtual ResourceType type() const = 0;
  [[nodiscard]] virtual bool allows_nested_names() const { return false; }

  [[nodiscard]] virtual common::Result<Resource> load(const std::filesystem::path &path) const = 0;
  [[nodiscard]] virtual common::Status validate(const Resource &resource) const;

  [[nodiscard]] virtual std::filesystem::path store_path(const std::filesystem::path &repo_root,
                                                         const std::string &name) const = 0;
  [[nodiscard]] virtual std::string link_name(const std::string &name) const = 0;
  [[nodiscard]] virtual std::string name_from_link(const std::filesystem::path &relative) const;

  [[nodiscard]] virtual std::vector<StoredEntry>
  scan(const std::filesystem::path &repo_root) const = 0;

  /// Places `resource` at its store path, either as a symlink to its absolute source
  /// path or as a recursive copy. The destination must not exist.
  [[nodiscard]] virtual common::Status store(const Resource &resource,
                                             const std::filesystem::path &repo_root,
                                             ImportMode mode) const;
};

class CommandKind final : public ResourceKind {
public:
  [[nodiscard]] ResourceType type() const override { return ResourceType::Command; }
  [[nodiscard]] bool allows_nested_names() const override { return true; }
  [[nodiscard]] common::Result<Resource> load(const std::filesystem::path &path) const override;
  [[nodiscard]] std::filesystem::path store_path(const std::filesystem::path &repo_root,
                                                 const std::string &name) const override;
  [[nodiscard]] std::string link_name(const std::string &name) const override;
  [[nodiscard]] std::vector<StoredEntry>
  scan(const std::filesystem::path &repo_root) const override;
};

class SkillKind final : public ResourceKind {
public:
  [[nodiscard]] ResourceType type() const override { return ResourceType::Skill; }
  [[nodiscard]] common::Result<Resource> load(const std::filesystem::path &path) const override;
  [[nodiscard]] common::Status validate(const Resource &resource) const override;
  [[nodiscard]] std::filesystem::path store_path(const std::filesystem::path &repo_root,
                                                 const std::string &name) const override;
  [[nodiscard]] std::string link_name(const std::string &name) const override;
  [[nodiscard]] std::vector<StoredEntry>
  scan(const std::filesystem::path &repo_root) const override;
};

class AgentKind final : public ResourceKind {
public:
  [[nodiscard]] ResourceType type() const override { return ResourceType::Agent; }
  [[nodiscard]] bool allows_nested_names() const override { return true; }
  [[nodiscard]] common::Result<Resource> load(const std::filesystem::path &path) const override;
  [[nodiscard]] std::filesystem::path store_path(const std::filesystem::path &repo_root,
                                                 const std::string &name) const override;
  [[nodiscard]] std::string link_name(const std::string &name) const override;
  [[nodiscard]] std::vector<StoredEntry>
  scan(const std::filesystem::path &repo_root) const override;
};

class PackageKind final : public ResourceKind {
public:
  [[nodiscard]] ResourceType type() const override { return ResourceType::Package; }
  [[nodiscard]] common::Result<Resource> load(const std::filesystem::path &path) const override;
  [[nodiscard]] common::Status validate(const Resource &resource) const override;
  [[nodiscard]] std::filesystem::path store_path(const std::filesystem::path &repo_root,
                                                 const std::string &name) const override;
  [[nodiscard]] std::string link_name(const std::string &name) const override;
  [[nodiscard]] std::vector<StoredEntry>
  scan(const std::filesystem::path &repo_root) const override;
  [[nodiscard]] common::Status store(const Resource &resource,
                                     const std::filesystem::path &repo_root,
                                     ImportMode mode) const override;
};

[[nodiscard]] const ResourceKind &kind_for(ResourceType type);

/// Classifies a candidate path:
///   directory containing SKILL.md            -> skill
///   *.package.json                           -> package
///   *.md under an `agents` / `commands` dir  -> agent / command
///   other *.md: frontmatter `type`, `instructions` or `capabilities` -> agent, else command
[[nodiscard]] common::Result<ResourceType> detect_type(const std::filesystem::path &path);

[[nodiscard]] common::Result<Resource> load_resource(const std::filesystem::path &path);

/// Name of a markdown resource: its path below the nearest ancestor directory called
/// `anchor` ("commands/api/deploy.md" -> "api/deploy"), or the file stem without one.
[[nodiscard]] std::string nested_markdown_name(const std::filesystem::path &path,
                                               const std::string &anchor);

[[nodiscard]] common::Result<Resource> load_markdown_resource(const std::filesystem::path &path,
                                                              ResourceType type,
                                                              const std::string &anchor);

[[nodiscard]] std::string package_to_json(const Resource &package);

} // namespace aimgr::resource
