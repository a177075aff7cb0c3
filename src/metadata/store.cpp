#include "aimgr/metadata/store.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace aimgr::metadata {

namespace {

constexpr const char *METADATA_SUFFIX = "-metadata.json";

std::string flatten_name(std::string name) {
  std::replace(name.begin(), name.end(), '/', '-');
  return name;
}

void write_field(std::ostringstream &out, const std::string &key, const std::string &value,
                 const bool last = false) {
  out << "  \"" << key << "\": \"" << common::json_escape(value) << "\"" << (last ? "\n" : ",\n");
}

} // namespace

bool ResourceMetadata::has_source(const std::string &id_or_name) const {
  if (id_or_name.empty()) {
    return false;
  }
  if (!source_id.empty() && source_id == id_or_name) {
    return true;
  }
  return source_name == id_or_name;
}

std::filesystem::path metadata_dir(const std::filesystem::path &repo_root) {
  return repo_root / ".metadata";
}

std::filesystem::path metadata_path(const std::filesystem::path &repo_root,
                                    const std::string &name, const resource::ResourceType type) {
  return metadata_dir(repo_root) / resource::resource_type_dir(type) /
         (flatten_name(name) + METADATA_SUFFIX);
}

std::string to_json(const ResourceMetadata &record) {
  const bool package = record.type == resource::ResourceType::Package;
  std::ostringstream out;
  out << "{\n";
  write_field(out, "name", record.name);
  if (!package) {
    write_field(out, "type", std::string(resource::resource_type_to_string(record.type)));
  }
  write_field(out, "source_type", record.source_type);
  write_field(out, "source_url", record.source_url);
  if (!record.source_name.empty()) {
    write_field(out, "source_name", record.source_name);
  }
  if (!record.source_id.empty()) {
    write_field(out, "source_id", record.source_id);
  }
  if (!record.ref.empty()) {
    write_field(out, package ? "source_ref" : "ref", record.ref);
  }
  write_field(out, package ? "first_added" : "first_installed", record.first_installed);
  if (package) {
    write_field(out, "last_updated", record.last_updated);
    out << "  \"resource_count\": " << record.resource_count << "\n";
  } else {
    write_field(out, "last_updated", record.last_updated, true);
  }
  out << "}\n";
  return out.str();
}

common::Result<ResourceMetadata> from_json(const std::string &json,
                                           const resource::ResourceType type) {
  const auto members = common::json_parse_members(json);
  if (members.empty()) {
    return common::Result<ResourceMetadata>::failure("failed to parse metadata JSON");
  }
  const bool package = type == resource::ResourceType::Package;

  ResourceMetadata record{
      .name = common::json_get_string(json, "name"),
      .type = type,
      .source_type = common::json_get_string(json, "source_type"),
      .source_url = common::json_get_string(json, "source_url"),
      .source_name = common::json_get_string(json, "source_name"),
      .source_id = common::json_get_string(json, "source_id"),
      .ref = common::json_get_string(json, package ? "source_ref" : "ref"),
      .first_installed = common::json_get_string(json, package ? "first_added" : "first_installed"),
      .last_updated = common::json_get_string(json, "last_updated"),
      .resource_count = static_cast<int>(common::json_get_int(json, "resource_count", 0)),
  };
  if (record.name.empty()) {
    return common::Result<ResourceMetadata>::failure("metadata record has no name");
  }
  return common::Result<ResourceMetadata>::success(std::move(record));
}

common::Result<ResourceMetadata> load(const std::filesystem::path &repo_root,
                                      const std::string &name,
                                      const resource::ResourceType type) {
  const auto path = metadata_path(repo_root, name, type);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<ResourceMetadata>::failure(
        "metadata not found for " + std::string(resource::resource_type_to_string(type)) + " '" +
        name + "'");
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<ResourceMetadata>::failure(content.error());
  }
  auto record = from_json(content.value(), type);
  if (!record.ok()) {
    return common::Result<ResourceMetadata>::failure(record.error() + ": " + path.string());
  }
  return record;
}

common::Status save(const std::filesystem::path &repo_root, const ResourceMetadata &record) {
  if (record.name.empty()) {
    return common::Status::error("metadata name cannot be empty");
  }
  return common::write_file(metadata_path(repo_root, record.name, record.type), to_json(record));
}

common::Status remove(const std::filesystem::path &repo_root, const std::string &name,
                      const resource::ResourceType type) {
  std::error_code ec;
  std::filesystem::remove(metadata_path(repo_root, name, type), ec);
  if (ec) {
    return common::Status::error("failed to remove metadata for '" + name + "': " + ec.message());
  }
  return common::Status::success();
}

bool exists(const std::filesystem::path &repo_root, const std::string &name,
            const resource::ResourceType type) {
  std::error_code ec;
  return std::filesystem::is_regular_file(metadata_path(repo_root, name, type), ec);
}

std::vector<ResourceMetadata> list(const std::filesystem::path &repo_root,
                                   const resource::ResourceType type) {
  std::vector<ResourceMetadata> records;
  const auto dir = metadata_dir(repo_root) / resource::resource_type_dir(type);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return records;
  }

  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (common::ends_with(it->path().filename().string(), METADATA_SUFFIX)) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());

  for (const auto &file : files) {
    auto content = common::read_file(file);
    if (!content.ok()) {
      continue;
    }
    auto record = from_json(content.value(), type);
    if (record.ok()) {
      records.push_back(std::move(record.value()));
    }
  }
  return records;
}

std::string source_type_for(const std::string &location, const bool is_remote) {
  if (!is_remote) {
    return "local";
  }
  return common::to_lower(location).find("github.com") != std::string::npos ? "github" : "git";
}

} // namespace aimgr::metadata
