#include "aimgr/tools/tools.hpp"

#include "aimgr/common/fs.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace aimgr::tools {

namespace {

void append_unique(std::vector<Tool> &tools, const Tool tool) {
  if (std::find(tools.begin(), tools.end(), tool) == tools.end()) {
    tools.push_back(tool);
  }
}

bool dir_exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

} // namespace

std::string_view tool_name(const Tool tool) {
  switch (tool) {
  case Tool::Claude:
    return "claude";
  case Tool::OpenCode:
    return "opencode";
  case Tool::Copilot:
    return "copilot";
  }
  return "unknown";
}

std::optional<Tool> parse_tool(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "claude") {
    return Tool::Claude;
  }
  if (normalized == "opencode") {
    return Tool::OpenCode;
  }
  if (normalized == "copilot" || normalized == "vscode") {
    return Tool::Copilot;
  }
  return std::nullopt;
}

std::string valid_tool_names() { return "claude, opencode, copilot, or vscode"; }

bool ToolInfo::supports(const resource::ResourceType type) const {
  switch (type) {
  case resource::ResourceType::Command:
    return supports_commands;
  case resource::ResourceType::Skill:
    return supports_skills;
  case resource::ResourceType::Agent:
    return supports_agents;
  case resource::ResourceType::Package:
    return false;
  }
  return false;
}

std::string ToolInfo::dir_for(const resource::ResourceType type) const {
  if (!supports(type)) {
    return "";
  }
  switch (type) {
  case resource::ResourceType::Command:
    return commands_dir;
  case resource::ResourceType::Skill:
    return skills_dir;
  case resource::ResourceType::Agent:
    return agents_dir;
  case resource::ResourceType::Package:
    break;
  }
  return "";
}

ToolInfo tool_info(const Tool tool) {
  switch (tool) {
  case Tool::Claude:
    return ToolInfo{.name = "Claude Code",
                    .commands_dir = ".claude/commands",
                    .skills_dir = ".claude/skills",
                    .agents_dir = ".claude/agents",
                    .supports_commands = true,
                    .supports_skills = true,
                    .supports_agents = true};
  case Tool::OpenCode:
    return ToolInfo{.name = "OpenCode",
                    .commands_dir = ".opencode/commands",
                    .skills_dir = ".opencode/skills",
                    .agents_dir = ".opencode/agents",
                    .supports_commands = true,
                    .supports_skills = true,
                    .supports_agents = true};
  case Tool::Copilot:
    return ToolInfo{.name = "GitHub Copilot / VSCode",
                    .skills_dir = ".github/skills",
                    .supports_skills = true};
  }
  return ToolInfo{};
}

std::vector<Tool> detect_existing_tools(const std::filesystem::path &project) {
  std::vector<Tool> detected;
  if (dir_exists(project / ".claude")) {
    detected.push_back(Tool::Claude);
  }
  if (dir_exists(project / ".opencode")) {
    detected.push_back(Tool::OpenCode);
  }
  // .github alone is common for CI; only its skills directory marks Copilot.
  if (dir_exists(project / ".github" / "skills")) {
    detected.push_back(Tool::Copilot);
  }
  return detected;
}

common::Result<std::vector<Tool>> parse_tool_list(const std::vector<std::string> &names) {
  std::vector<Tool> tools;
  for (const auto &name : names) {
    const auto tool = parse_tool(name);
    if (!tool.has_value()) {
      return common::Result<std::vector<Tool>>::failure(
          "unknown tool: " + name + " (must be: " + valid_tool_names() + ")");
    }
    append_unique(tools, *tool);
  }
  return common::Result<std::vector<Tool>>::success(std::move(tools));
}

common::Result<std::vector<Tool>> read_project_targets(const std::filesystem::path &project) {
  const auto path = project / PROJECT_MANIFEST_FILE;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<std::vector<Tool>>::success({});
  }

  std::vector<std::string> names;
  try {
    const YAML::Node root = YAML::LoadFile(path.string());
    YAML::Node targets;
    if (root["install"] && root["install"]["targets"]) {
      targets = root["install"]["targets"];
    } else if (root["targets"]) {
      targets = root["targets"];
    }
    if (targets && targets.IsSequence()) {
      for (const auto &item : targets) {
        names.push_back(item.as<std::string>());
      }
    }
  } catch (const YAML::Exception &ex) {
    return common::Result<std::vector<Tool>>::failure("failed to read " + path.string() + ": " +
                                                      ex.what());
  }
  return parse_tool_list(names);
}

std::vector<Tool> resolve_targets(const std::vector<Tool> &explicit_targets,
                                  const std::vector<Tool> &detected,
                                  const std::vector<Tool> &manifest_targets,
                                  const std::vector<Tool> &defaults) {
  for (const auto *candidate : {&explicit_targets, &detected, &manifest_targets, &defaults}) {
    if (!candidate->empty()) {
      return *candidate;
    }
  }
  return {};
}

} // namespace aimgr::tools
