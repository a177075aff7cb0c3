#pragma once

#include "aimgr/common/result.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aimgr::resource {

enum class ResourceType {
  Command,
  Skill,
  Agent,
  Package,
};

inline constexpr std::array<ResourceType, 4> ALL_RESOURCE_TYPES = {
    ResourceType::Command, ResourceType::Skill, ResourceType::Agent, ResourceType::Package};

inline constexpr std::size_t MAX_NAME_SEGMENT_LENGTH = 64;
inline constexpr std::size_t MAX_SKILL_DESCRIPTION_LENGTH = 1024;

[[nodiscard]] std::string_view resource_type_to_string(ResourceType type);
[[nodiscard]] std::string resource_type_dir(ResourceType type);
[[nodiscard]] std::optional<ResourceType> parse_resource_type(const std::string &value);

struct Resource {
  ResourceType type = ResourceType::Command;
  std::string name;
  std::string description;
  std::string version;
  std::string author;
  std::string license;
  std::filesystem::path path;
  std::map<std::string, std::string> fields;
  std::vector<std::string> references; // packages only, "type/name"

  [[nodiscard]] std::string id() const;
};

struct ResourceRef {
  ResourceType type = ResourceType::Command;
  std::string name;
};

[[nodiscard]] common::Result<ResourceRef> parse_resource_reference(const std::string &reference);

/// Lowercase alphanumerics and single hyphens per `/`-separated segment, each at most
/// 64 characters. Nested segments are rejected unless `allow_nested`.
[[nodiscard]] common::Status validate_resource_name(const std::string &name, bool allow_nested);

[[nodiscard]] common::Status validate_description(ResourceType type,
                                                  const std::string &description);

} // namespace aimgr::resource
