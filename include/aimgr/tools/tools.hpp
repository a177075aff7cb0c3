#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/resource/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aimgr::tools {

enum class Tool {
  Claude,
  OpenCode,
  Copilot,
};

inline constexpr std::array<Tool, 3> ALL_TOOLS = {Tool::Claude, Tool::OpenCode, Tool::Copilot};

inline constexpr const char *PROJECT_MANIFEST_FILE = "ai.package.yaml";

[[nodiscard]] std::string_view tool_name(Tool tool);
[[nodiscard]] std::optional<Tool> parse_tool(const std::string &value);
[[nodiscard]] std::string valid_tool_names();

struct ToolInfo {
  std::string name;
  std::string commands_dir;
  std::string skills_dir;
  std::string agents_dir;
  bool supports_commands = false;
  bool supports_skills = false;
  bool supports_agents = false;

  [[nodiscard]] bool supports(resource::ResourceType type) const;
  [[nodiscard]] std::string dir_for(resource::ResourceType type) const;
};

[[nodiscard]] ToolInfo tool_info(Tool tool);

[[nodiscard]] std::vector<Tool> detect_existing_tools(const std::filesystem::path &project);

[[nodiscard]] common::Result<std::vector<Tool>>
read_project_targets(const std::filesystem::path &project);

[[nodiscard]] common::Result<std::vector<Tool>>
parse_tool_list(const std::vector<std::string> &names);

/// First non-empty of: explicit targets, detected tool directories, ai.package.yaml
/// targets, configured defaults.
[[nodiscard]] std::vector<Tool> resolve_targets(const std::vector<Tool> &explicit_targets,
                                                const std::vector<Tool> &detected,
                                                const std::vector<Tool> &manifest_targets,
                                                const std::vector<Tool> &defaults);

} // namespace aimgr::tools
