#include "tests/helpers/test_helpers.hpp"

#include "aimgr/common/process.hpp"
#include "aimgr/observability/global.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace aimgr::testing {

namespace {

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<RecordedObservations> recorded)
      : recorded_(std::move(recorded)) {}

  void record_event(const observability::ObserverEvent &event) override {
    recorded_->events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    recorded_->metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<RecordedObservations> recorded_;
};

} // namespace

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("aimgr-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  path_ = std::filesystem::canonical(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  write_file(path_ / name, content);
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ObserverCapture::ObserverCapture() : recorded_(std::make_shared<RecordedObservations>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(recorded_));
}

ObserverCapture::~ObserverCapture() { observability::set_global_observer(nullptr); }

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::string markdown_resource(const std::string &description, const std::string &extra_frontmatter) {
  std::string content = "---\ndescription: " + description + "\n";
  if (!extra_frontmatter.empty()) {
    content += extra_frontmatter;
    if (content.back() != '\n') {
      content += "\n";
    }
  }
  content += "---\n\nBody text.\n";
  return content;
}

void make_command(const std::filesystem::path &root, const std::string &relative,
                  const std::string &description) {
  write_file(root / relative, markdown_resource(description));
}

void make_agent(const std::filesystem::path &root, const std::string &relative,
                const std::string &description) {
  write_file(root / relative, markdown_resource(description, "type: agent"));
}

void make_skill(const std::filesystem::path &root, const std::string &relative,
                const std::string &description) {
  const auto dir = root / relative;
  const std::string name = dir.filename().string();
  write_file(dir / "SKILL.md", "---\nname: " + name + "\ndescription: " + description +
                                   "\n---\n\n# " + name + "\n");
}

std::string snapshot_tree(const std::filesystem::path &root) {
  std::vector<std::string> lines;
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    return "";
  }
  for (std::filesystem::recursive_directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto relative = it->path().lexically_relative(root).generic_string();
    if (relative == ".git") {
      it.disable_recursion_pending();
      continue;
    }
    std::error_code entry_ec;
    if (it->is_symlink(entry_ec)) {
      const auto target = std::filesystem::read_symlink(it->path(), entry_ec);
      lines.push_back(relative + " -> " + target.string());
    } else if (it->is_directory(entry_ec)) {
      lines.push_back(relative + "/");
    } else {
      lines.push_back(relative + " = " + read_file(it->path()));
    }
  }
  std::sort(lines.begin(), lines.end());
  std::string out;
  for (const auto &line : lines) {
    out += line + "\n";
  }
  return out;
}

bool git_available() { return common::command_exists("git"); }

void git_commit_all(const std::filesystem::path &dir, const std::string &message) {
  std::error_code ec;
  if (!std::filesystem::exists(dir / ".git", ec)) {
    auto initialized = common::run_git(dir, {"init", "-q"});
    if (!initialized.ok()) {
      throw std::runtime_error("git init failed: " + initialized.error());
    }
  }
  auto added = common::run_git(dir, {"add", "-A"});
  if (!added.ok()) {
    throw std::runtime_error("git add failed: " + added.error());
  }
  auto committed = common::run_git(dir, {"commit", "-q", "--allow-empty", "-m", message});
  if (!committed.ok()) {
    throw std::runtime_error("git commit failed: " + committed.error());
  }
}

} // namespace aimgr::testing
