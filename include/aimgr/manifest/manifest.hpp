#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/manifest/source_state.hpp"
#include "aimgr/resource/kind.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace aimgr::manifest {

inline constexpr const char *MANIFEST_FILE = "ai.repo.yaml";
inline constexpr int MANIFEST_VERSION = 1;
inline constexpr std::size_t MAX_SOURCE_NAME_LENGTH = 64;

struct Source {
  std::string id;
  std::string name;
  std::string path;
  std::string url;
  std::string ref;
  std::string subpath;
  std::string mode; // empty means derived from path/url

  [[nodiscard]] bool is_remote() const { return !url.empty(); }
  [[nodiscard]] const std::string &location() const { return url.empty() ? path : url; }
  [[nodiscard]] resource::ImportMode import_mode() const;
};

/// "src-" + the first 12 hex characters of SHA-256 over the canonical location.
/// Returns an empty string for a source with neither path nor url.
[[nodiscard]] std::string generate_source_id(const Source &source);
[[nodiscard]] std::string generate_source_name(const Source &source);
[[nodiscard]] bool is_valid_source_name(const std::string &name);

class Manifest {
public:
  /// A missing file yields an empty manifest. Source IDs missing from older files are
  /// generated, and `added`/`last_synced` fields are moved into the source state store.
  [[nodiscard]] static common::Result<Manifest> load(const std::filesystem::path &repo_root);
  [[nodiscard]] static common::Result<Manifest> parse(const std::string &yaml);

  [[nodiscard]] common::Status save(const std::filesystem::path &repo_root) const;
  [[nodiscard]] std::string to_yaml() const;
  [[nodiscard]] common::Status validate() const;

  [[nodiscard]] common::Result<Source> add_source(Source source);
  /// Looks up by name, then path, then URL, then id.
  [[nodiscard]] common::Result<Source> remove_source(const std::string &key);
  [[nodiscard]] const Source *get_source(const std::string &key) const;
  [[nodiscard]] bool has_source(const std::string &key) const;

  [[nodiscard]] int version() const { return version_; }
  [[nodiscard]] const std::vector<Source> &sources() const { return sources_; }

private:
  [[nodiscard]] std::ptrdiff_t find_index(const std::string &key) const;

  int version_ = MANIFEST_VERSION;
  std::vector<Source> sources_;
  // Filled by parse() from pre-state-store manifests; consumed by load().
  std::map<std::string, SourceRecord> legacy_timestamps_;
  bool ids_generated_ = false;
};

} // namespace aimgr::manifest
