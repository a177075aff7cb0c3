#include "aimgr/resource/types.hpp"

#include "aimgr/common/fs.hpp"

#include <regex>

namespace aimgr::resource {

namespace {

const std::regex &name_segment_pattern() {
  static const std::regex pattern("^[a-z0-9]([a-z0-9-]*[a-z0-9])?$");
  return pattern;
}

} // namespace

std::string_view resource_type_to_string(const ResourceType type) {
  switch (type) {
  case ResourceType::Command:
    return "command";
  case ResourceType::Skill:
    return "skill";
  case ResourceType::Agent:
    return "agent";
  case ResourceType::Package:
    return "package";
  }
  return "unknown";
}

std::string resource_type_dir(const ResourceType type) {
  return std::string(resource_type_to_string(type)) + "s";
}

std::optional<ResourceType> parse_resource_type(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const auto type : ALL_RESOURCE_TYPES) {
    if (normalized == resource_type_to_string(type) || normalized == resource_type_dir(type)) {
      return type;
    }
  }
  return std::nullopt;
}

std::string Resource::id() const {
  return std::string(resource_type_to_string(type)) + "/" + name;
}

common::Result<ResourceRef> parse_resource_reference(const std::string &reference) {
  const auto slash = reference.find('/');
  if (slash == std::string::npos) {
    return common::Result<ResourceRef>::failure("invalid resource format: \"" + reference +
                                                "\" (expected type/name)");
  }

  const std::string type_str = reference.substr(0, slash);
  const std::string name = reference.substr(slash + 1);
  const auto type = parse_resource_type(type_str);
  if (!type.has_value() || *type == ResourceType::Package) {
    return common::Result<ResourceRef>::failure("invalid resource type: \"" + type_str +
                                                "\" (expected command/skill/agent)");
  }
  if (name.empty()) {
    return common::Result<ResourceRef>::failure("resource name cannot be empty in: \"" +
                                                reference + "\"");
  }
  return common::Result<ResourceRef>::success(ResourceRef{.type = *type, .name = name});
}

common::Status validate_resource_name(const std::string &name, const bool allow_nested) {
  if (name.empty()) {
    return common::Status::error("name cannot be empty");
  }
  if (name.find("--") != std::string::npos) {
    return common::Status::error("name cannot contain consecutive hyphens");
  }
  if (!allow_nested && name.find('/') != std::string::npos) {
    return common::Status::error("name '" + name + "' cannot contain '/'");
  }
  if (common::ends_with(name, "/")) {
    return common::Status::error("empty segment in name '" + name + "'");
  }

  const auto segments = common::split(name, '/');
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto &segment = segments[i];
    if (segment.empty()) {
      return common::Status::error("empty segment in path at position " + std::to_string(i));
    }
    if (segment.size() > MAX_NAME_SEGMENT_LENGTH) {
      return common::Status::error("segment '" + segment + "' too long (" +
                                   std::to_string(segment.size()) + " chars, max 64)");
    }
    if (!std::regex_match(segment, name_segment_pattern())) {
      return common::Status::error("segment '" + segment +
                                   "' invalid: must be lowercase alphanumeric + hyphens, "
                                   "cannot start/end with hyphen");
    }
  }
  return common::Status::success();
}

common::Status validate_description(const ResourceType type, const std::string &description) {
  if (common::trim(description).empty()) {
    return common::Status::error("description is required");
  }
  if (type == ResourceType::Skill && description.size() > MAX_SKILL_DESCRIPTION_LENGTH) {
    return common::Status::error("description too long (" + std::to_string(description.size()) +
                                 " chars, max 1024)");
  }
  return common::Status::success();
}

} // namespace aimgr::resource
