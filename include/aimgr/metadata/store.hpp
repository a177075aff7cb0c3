#pragma once

#include "aimgr/common/result.hpp"
#include "aimgr/resource/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace aimgr::metadata {

/// Provenance record kept beside every stored resource under `.metadata/`.
/// Package records serialize `ref` as `source_ref` and `first_installed` as
/// `first_added`, and additionally carry `resource_count`.
struct ResourceMetadata {
  std::string name;
  resource::ResourceType type = resource::ResourceType::Command;
  std::string source_type; // "github", "git", "local" or "file"
  std::string source_url;
  std::string source_name;
  std::string source_id;
  std::string ref;
  std::string first_installed;
  std::string last_updated;
  int resource_count = 0;

  [[nodiscard]] bool has_source(const std::string &id_or_name) const;
};

[[nodiscard]] std::filesystem::path metadata_dir(const std::filesystem::path &repo_root);

/// `.metadata/<type>s/<name with '/' replaced by '-'>-metadata.json`
[[nodiscard]] std::filesystem::path metadata_path(const std::filesystem::path &repo_root,
                                                  const std::string &name,
                                                  resource::ResourceType type);

[[nodiscard]] std::string to_json(const ResourceMetadata &record);
[[nodiscard]] common::Result<ResourceMetadata> from_json(const std::string &json,
                                                         resource::ResourceType type);

[[nodiscard]] common::Result<ResourceMetadata> load(const std::filesystem::path &repo_root,
                                                    const std::string &name,
                                                    resource::ResourceType type);
[[nodiscard]] common::Status save(const std::filesystem::path &repo_root,
                                 const ResourceMetadata &record);
[[nodiscard]] common::Status remove(const std::filesystem::path &repo_root,
                                    const std::string &name, resource::ResourceType type);
[[nodiscard]] bool exists(const std::filesystem::path &repo_root, const std::string &name,
                          resource::ResourceType type);

[[nodiscard]] std::vector<ResourceMetadata> list(const std::filesystem::path &repo_root,
                                                 resource::ResourceType type);

[[nodiscard]] std::string source_type_for(const std::string &location, bool is_remote);

} // namespace aimgr::metadata
