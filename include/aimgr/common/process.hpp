#pragma once

#include "aimgr/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::common {

[[nodiscard]] std::string shell_quote(const std::string &value);
[[nodiscard]] bool command_exists(const std::string &name);

/// Runs `command` through the shell and returns its combined stdout/stderr.
/// A non-zero exit becomes a failure that carries the captured output.
[[nodiscard]] Result<std::string> run_capture_command(const std::string &command);

[[nodiscard]] Result<std::string> run_git(const std::filesystem::path &dir,
                                          const std::vector<std::string> &args);

} // namespace aimgr::common
