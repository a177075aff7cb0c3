#include "aimgr/common/process.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace aimgr::common {

std::string shell_quote(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 4);
  out.push_back('\'');
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
      continue;
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

bool command_exists(const std::string &name) {
  const std::string command = "command -v " + shell_quote(name) + " >/dev/null 2>&1";
  return std::system(command.c_str()) == 0;
}

Result<std::string> run_capture_command(const std::string &command) {
  std::array<char, 4096> buffer{};
  std::string output;
  const std::string merged = command + " 2>&1";
  FILE *pipe = popen(merged.c_str(), "r");
  if (pipe == nullptr) {
    return Result<std::string>::failure("failed to launch command");
  }

  while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    output += buffer.data();
  }
  const int rc = pclose(pipe);
  if (rc != 0) {
    const int code = WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
    return Result<std::string>::failure("command failed with exit code " + std::to_string(code) +
                                        (output.empty() ? "" : "\nOutput: " + output));
  }
  return Result<std::string>::success(output);
}

Result<std::string> run_git(const std::filesystem::path &dir,
                            const std::vector<std::string> &args) {
  std::string command = "git";
  if (!dir.empty()) {
    command += " -C " + shell_quote(dir.string());
  }
  for (const auto &arg : args) {
    command += " " + shell_quote(arg);
  }
  return run_capture_command(command);
}

} // namespace aimgr::common
