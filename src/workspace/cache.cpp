#include "aimgr/workspace/cache.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/hash.hpp"
#include "aimgr/common/json_util.hpp"
#include "aimgr/common/process.hpp"
#include "aimgr/observability/global.hpp"
#include "aimgr/source/parser.hpp"

#include <algorithm>
#include <sstream>

namespace aimgr::workspace {

namespace {

constexpr const char *METADATA_FILE = ".cache-metadata.json";

std::string metadata_to_json(const std::map<std::string, CacheEntry> &caches) {
  std::ostringstream out;
  out << "{\n  \"version\": \"1.0\",\n  \"caches\": {";
  bool first = true;
  for (const auto &[hash, entry] : caches) {
    out << (first ? "\n" : ",\n");
    first = false;
    out << "    \"" << hash << "\": {";
    out << "\"url\": \"" << common::json_escape(entry.url) << "\", ";
    out << "\"ref\": \"" << common::json_escape(entry.ref) << "\", ";
    out << "\"last_accessed\": \"" << entry.last_accessed << "\", ";
    out << "\"last_updated\": \"" << entry.last_updated << "\"}";
  }
  out << (first ? "}\n}\n" : "\n  }\n}\n");
  return out.str();
}

std::uintmax_t tree_size(const std::filesystem::path &dir) {
  std::uintmax_t total = 0;
  std::error_code ec;
  for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code size_ec;
    if (it->is_regular_file(size_ec) && !it->is_symlink(size_ec)) {
      const auto size = it->file_size(size_ec);
      if (!size_ec) {
        total += size;
      }
    }
  }
  return total;
}

} // namespace

WorkspaceCache::WorkspaceCache(const std::filesystem::path &repo_root)
    : dir_(repo_root / ".workspace") {}

std::filesystem::path WorkspaceCache::cache_path(const std::string &url) const {
  return dir_ / common::sha256_hex(source::normalize_url(url));
}

bool WorkspaceCache::is_valid_cache(const std::filesystem::path &path) const {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec) &&
         std::filesystem::is_directory(path / ".git", ec);
}

common::Status WorkspaceCache::clone(const std::string &url, const std::filesystem::path &path,
                                     const std::string &ref) const {
  std::vector<std::string> args = {"clone"};
  if (!ref.empty()) {
    args.push_back("--branch");
    args.push_back(ref);
  }
  args.push_back(url);
  args.push_back(path.string());

  auto cloned = common::run_git(dir_, args);
  if (!cloned.ok()) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return common::Status::error("git clone failed: " + cloned.error());
  }
  return common::Status::success();
}

common::Result<std::filesystem::path>
WorkspaceCache::get_or_clone(const std::string &url, const std::string &ref, const bool refresh) {
  if (common::trim(url).empty()) {
    return common::Result<std::filesystem::path>::failure("url cannot be empty");
  }
  auto ensured = common::ensure_dir(dir_);
  if (!ensured.ok()) {
    return common::Result<std::filesystem::path>::failure(
        "failed to create workspace directory: " + ensured.error());
  }

  const auto path = cache_path(url);
  if (is_valid_cache(path)) {
    bool usable = true;
    if (!ref.empty()) {
      auto checked_out = common::run_git(path, {"checkout", ref});
      if (!checked_out.ok()) {
        auto fetched = common::run_git(path, {"fetch", "--all"});
        if (!fetched.ok()) {
          usable = false;
        } else {
          auto retried = common::run_git(path, {"checkout", ref});
          if (!retried.ok()) {
            return common::Result<std::filesystem::path>::failure(
                "failed to checkout ref after fetch: " + retried.error());
          }
        }
      }
    }

    if (usable) {
      bool updated = false;
      if (refresh) {
        // Detached checkouts (tags, commits) have nothing to fast-forward.
        auto branch = common::run_git(path, {"symbolic-ref", "-q", "HEAD"});
        if (branch.ok()) {
          auto pulled = common::run_git(path, {"pull", "--ff-only"});
          if (pulled.ok()) {
            updated = true;
          } else {
            observability::record_warning("workspace", "failed to update cached clone of " + url +
                                                           ": " + pulled.error());
          }
        }
      }
      touch_metadata(url, ref, updated);
      return common::Result<std::filesystem::path>::success(path);
    }

    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure("failed to remove corrupted cache: " +
                                                            ec.message());
    }
  } else if (common::entry_exists(path)) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  auto cloned = clone(url, path, ref);
  if (!cloned.ok()) {
    return common::Result<std::filesystem::path>::failure("failed to clone repository: " +
                                                          cloned.error());
  }
  touch_metadata(url, ref, true);
  return common::Result<std::filesystem::path>::success(path);
}

std::map<std::string, CacheEntry> WorkspaceCache::load_metadata() const {
  std::map<std::string, CacheEntry> caches;
  auto content = common::read_file(dir_ / METADATA_FILE);
  if (!content.ok()) {
    return caches;
  }
  const std::string raw_caches = common::json_get_object(content.value(), "caches");
  for (const auto &[hash, raw] : common::json_parse_members(raw_caches)) {
    caches[hash] = CacheEntry{
        .url = common::json_get_string(raw, "url"),
        .ref = common::json_get_string(raw, "ref"),
        .last_accessed = common::json_get_string(raw, "last_accessed"),
        .last_updated = common::json_get_string(raw, "last_updated"),
    };
  }
  return caches;
}

void WorkspaceCache::touch_metadata(const std::string &url, const std::string &ref,
                                    const bool updated) const {
  auto caches = load_metadata();
  const std::string now = common::now_rfc3339();
  auto &entry = caches[common::sha256_hex(source::normalize_url(url))];
  entry.url = source::normalize_url(url);
  entry.ref = ref;
  entry.last_accessed = now;
  if (updated || entry.last_updated.empty()) {
    entry.last_updated = now;
  }
  auto status = save_metadata(caches);
  if (!status.ok()) {
    observability::record_warning("workspace", "failed to update cache metadata: " +
                                                   status.error());
  }
}

common::Status
WorkspaceCache::save_metadata(const std::map<std::string, CacheEntry> &caches) const {
  return common::write_file(dir_ / METADATA_FILE, metadata_to_json(caches));
}

std::vector<CachedCheckout> WorkspaceCache::list_cached() const {
  std::vector<CachedCheckout> checkouts;
  const auto caches = load_metadata();
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec)) {
      continue;
    }
    const std::string hash = it->path().filename().string();
    const auto known = caches.find(hash);
    checkouts.push_back(CachedCheckout{
        .hash = hash,
        .url = known == caches.end() ? "" : known->second.url,
        .path = it->path(),
        .size_bytes = tree_size(it->path()),
    });
  }
  std::sort(checkouts.begin(), checkouts.end(),
            [](const CachedCheckout &a, const CachedCheckout &b) { return a.hash < b.hash; });
  return checkouts;
}

common::Status WorkspaceCache::remove_cached(const std::string &hash) const {
  if (hash.empty() || hash.find('/') != std::string::npos || hash.starts_with(".")) {
    return common::Status::error("invalid cache entry: '" + hash + "'");
  }
  std::error_code ec;
  std::filesystem::remove_all(dir_ / hash, ec);
  if (ec) {
    return common::Status::error("failed to remove " + (dir_ / hash).string() + ": " +
                                 ec.message());
  }
  auto caches = load_metadata();
  if (caches.erase(hash) > 0) {
    return save_metadata(caches);
  }
  return common::Status::success();
}

} // namespace aimgr::workspace
