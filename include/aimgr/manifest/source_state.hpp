#pragma once

#include "aimgr/common/result.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace aimgr::manifest {

struct SourceRecord {
  std::string source_id;
  std::string added;
  std::string last_synced;
};

/// Timestamps for each configured source, keyed by source name and kept in
/// `.metadata/sources.json` so that the manifest itself stays stable under sync.
class SourceState {
public:
  [[nodiscard]] static common::Result<SourceState> load(const std::filesystem::path &repo_root);
  [[nodiscard]] static std::filesystem::path path_for(const std::filesystem::path &repo_root);

  [[nodiscard]] common::Status save(const std::filesystem::path &repo_root) const;

  [[nodiscard]] const SourceRecord *get(const std::string &name) const;
  void set_added(const std::string &name, const std::string &source_id,
                 const std::string &timestamp);
  void set_last_synced(const std::string &name, const std::string &source_id,
                       const std::string &timestamp);
  void erase(const std::string &name);
  void rename(const std::string &from, const std::string &to);

  [[nodiscard]] const std::map<std::string, SourceRecord> &sources() const { return sources_; }

private:
  std::map<std::string, SourceRecord> sources_;
};

} // namespace aimgr::manifest
