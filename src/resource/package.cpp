#include "aimgr/common/fs.hpp"
#include "aimgr/common/json_util.hpp"
#include "aimgr/resource/kind.hpp"

#include <sstream>

namespace aimgr::resource {

namespace {

constexpr const char *PACKAGE_SUFFIX = ".package.json";

std::string package_name_from_file(const std::filesystem::path &path) {
  std::string filename = path.filename().string();
  const std::string suffix = PACKAGE_SUFFIX;
  if (common::ends_with(filename, suffix)) {
    filename.resize(filename.size() - suffix.size());
  }
  return filename;
}

} // namespace

common::Result<Resource> PackageKind::load(const std::filesystem::path &path) const {
  if (!common::ends_with(path.filename().string(), PACKAGE_SUFFIX)) {
    return common::Result<Resource>::failure("package must be a .package.json file: " +
                                             path.string());
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Resource>::failure(content.error());
  }
  const auto members = common::json_parse_members(content.value());
  if (members.empty()) {
    return common::Result<Resource>::failure("failed to parse package JSON: " + path.string());
  }

  Resource resource{
      .type = ResourceType::Package,
      .name = common::json_get_string(content.value(), "name"),
      .description = common::json_get_string(content.value(), "description"),
      .version = common::json_get_string(content.value(), "version"),
      .author = common::json_get_string(content.value(), "author"),
      .path = path,
      .references = common::json_get_string_array(content.value(), "resources"),
  };
  if (resource.name.empty()) {
    resource.name = package_name_from_file(path);
  }
  return common::Result<Resource>::success(std::move(resource));
}

common::Status PackageKind::validate(const Resource &resource) const {
  auto base = ResourceKind::validate(resource);
  if (!base.ok()) {
    return base;
  }
  for (const auto &reference : resource.references) {
    auto parsed = parse_resource_reference(reference);
    if (!parsed.ok()) {
      return common::Status::error("invalid package '" + resource.name + "': " +
                                   parsed.error());
    }
  }
  return common::Status::success();
}

std::filesystem::path PackageKind::store_path(const std::filesystem::path &repo_root,
                                              const std::string &name) const {
  return repo_root / "packages" / (name + PACKAGE_SUFFIX);
}

std::string PackageKind::link_name(const std::string &name) const {
  return name + PACKAGE_SUFFIX;
}

std::vector<StoredEntry> PackageKind::scan(const std::filesystem::path &repo_root) const {
  std::vector<StoredEntry> entries;
  const auto dir = repo_root / "packages";
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return entries;
  }
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!common::ends_with(it->path().filename().string(), PACKAGE_SUFFIX)) {
      continue;
    }
    entries.push_back(
        StoredEntry{.name = package_name_from_file(it->path()), .path = it->path()});
  }
  return entries;
}

common::Status PackageKind::store(const Resource &resource,
                                  const std::filesystem::path &repo_root,
                                  ImportMode /*mode*/) const {
  return ResourceKind::store(resource, repo_root, ImportMode::Copy);
}

std::string package_to_json(const Resource &package) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"name\": \"" << common::json_escape(package.name) << "\",\n";
  out << "  \"description\": \"" << common::json_escape(package.description) << "\",\n";
  if (!package.version.empty()) {
    out << "  \"version\": \"" << common::json_escape(package.version) << "\",\n";
  }
  out << "  \"resources\": " << common::json_string_array(package.references) << "\n";
  out << "}\n";
  return out.str();
}

} // namespace aimgr::resource
