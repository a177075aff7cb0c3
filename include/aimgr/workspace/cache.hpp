#pragma once

#include "aimgr/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace aimgr::workspace {

struct CacheEntry {
  std::string url;
  std::string ref;
  std::string last_accessed;
  std::string last_updated;
};

struct CachedCheckout {
  std::string hash;
  std::string url; // empty when the clone has no metadata entry
  std::filesystem::path path;
  std::uintmax_t size_bytes = 0;
};

class WorkspaceCache {
public:
  explicit WorkspaceCache(const std::filesystem::path &repo_root);

  /// Returns a checkout of `url` at `ref` (the default branch when empty). An existing
  /// clone is checked out in place, fetching once if the ref is unknown; a clone that
  /// cannot be repaired is discarded and cloned again. With `refresh`, an existing
  /// branch checkout is fast-forwarded.
  [[nodiscard]] common::Result<std::filesystem::path>
  get_or_clone(const std::string &url, const std::string &ref, bool refresh = false);

  [[nodiscard]] std::filesystem::path cache_path(const std::string &url) const;
  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

  [[nodiscard]] std::map<std::string, CacheEntry> load_metadata() const;

  /// Clone directories under the workspace, sorted by hash.
  [[nodiscard]] std::vector<CachedCheckout> list_cached() const;
  /// Deletes the clone and its metadata entry.
  [[nodiscard]] common::Status remove_cached(const std::string &hash) const;

private:
  [[nodiscard]] bool is_valid_cache(const std::filesystem::path &path) const;
  [[nodiscard]] common::Status clone(const std::string &url, const std::filesystem::path &path,
                                     const std::string &ref) const;
  void touch_metadata(const std::string &url, const std::string &ref, bool updated) const;
  [[nodiscard]] common::Status save_metadata(const std::map<std::string, CacheEntry> &caches) const;

  std::filesystem::path dir_;
};

} // namespace aimgr::workspace
