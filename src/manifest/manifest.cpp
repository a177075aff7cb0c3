#include "aimgr/manifest/manifest.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/observability/global.hpp"

#include <set>
#include <yaml-cpp/yaml.h>

namespace aimgr::manifest {

namespace {

std::string scalar_or_empty(const YAML::Node &node, const char *key) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull() || !value.IsScalar()) {
    return "";
  }
  return value.as<std::string>();
}

common::Status validate_source(const Source &source) {
  if (source.name.empty()) {
    return common::Status::error("source name cannot be empty");
  }
  if (!is_valid_source_name(source.name)) {
    return common::Status::error("invalid source name '" + source.name +
                                 "': must be lowercase alphanumeric with hyphens, 1-64 chars");
  }
  if (source.path.empty() && source.url.empty()) {
    return common::Status::error("source must have either path or url");
  }
  if (!source.path.empty() && !source.url.empty()) {
    return common::Status::error("source cannot have both path and url");
  }
  if (!source.mode.empty() && !resource::parse_import_mode(source.mode).has_value()) {
    return common::Status::error("invalid mode '" + source.mode + "' (expected symlink or copy)");
  }
  return common::Status::success();
}

std::string with_suffix(const std::string &base, const int n) {
  const std::string suffix = "-" + std::to_string(n);
  std::string head = base;
  if (head.size() + suffix.size() > MAX_SOURCE_NAME_LENGTH) {
    head.resize(MAX_SOURCE_NAME_LENGTH - suffix.size());
    while (!head.empty() && head.back() == '-') {
      head.pop_back();
    }
  }
  return head + suffix;
}

} // namespace

common::Result<Manifest> Manifest::parse(const std::string &yaml) {
  Manifest manifest;
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &ex) {
    return common::Result<Manifest>::failure(std::string("failed to parse manifest YAML: ") +
                                             ex.what());
  }
  if (!root || root.IsNull()) {
    return common::Result<Manifest>::success(std::move(manifest));
  }
  if (!root.IsMap()) {
    return common::Result<Manifest>::failure("failed to parse manifest YAML: expected a mapping");
  }

  try {
    manifest.version_ = root["version"] ? root["version"].as<int>() : 0;
    const YAML::Node sources = root["sources"];
    if (sources && sources.IsSequence()) {
      for (const auto &node : sources) {
        Source source{
            .id = scalar_or_empty(node, "id"),
            .name = scalar_or_empty(node, "name"),
            .path = scalar_or_empty(node, "path"),
            .url = scalar_or_empty(node, "url"),
            .ref = scalar_or_empty(node, "ref"),
            .subpath = scalar_or_empty(node, "subpath"),
            .mode = scalar_or_empty(node, "mode"),
        };
        if (source.id.empty()) {
          source.id = generate_source_id(source);
          manifest.ids_generated_ = manifest.ids_generated_ || !source.id.empty();
        }
        const std::string added = scalar_or_empty(node, "added");
        const std::string last_synced = scalar_or_empty(node, "last_synced");
        if (!added.empty() || !last_synced.empty()) {
          manifest.legacy_timestamps_[source.name] = SourceRecord{
              .source_id = source.id, .added = added, .last_synced = last_synced};
        }
        manifest.sources_.push_back(std::move(source));
      }
    } else if (sources && !sources.IsNull()) {
      return common::Result<Manifest>::failure(
          "failed to parse manifest YAML: sources must be a list");
    }
  } catch (const YAML::Exception &ex) {
    return common::Result<Manifest>::failure(std::string("failed to parse manifest YAML: ") +
                                             ex.what());
  }

  auto status = manifest.validate();
  if (!status.ok()) {
    return common::Result<Manifest>::failure("invalid manifest: " + status.error());
  }
  return common::Result<Manifest>::success(std::move(manifest));
}

common::Result<Manifest> Manifest::load(const std::filesystem::path &repo_root) {
  const auto path = repo_root / MANIFEST_FILE;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Manifest>::success(Manifest{});
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Manifest>::failure("failed to read manifest: " + content.error());
  }
  auto parsed = parse(content.value());
  if (!parsed.ok()) {
    return parsed;
  }
  Manifest manifest = std::move(parsed.value());

  if (!manifest.legacy_timestamps_.empty()) {
    auto state = SourceState::load(repo_root);
    if (!state.ok()) {
      return common::Result<Manifest>::failure("failed to migrate manifest: " + state.error());
    }
    for (const auto &[name, legacy] : manifest.legacy_timestamps_) {
      const SourceRecord *existing = state.value().get(name);
      if (existing == nullptr || existing->added.empty()) {
        state.value().set_added(name, legacy.source_id,
                                legacy.added.empty() ? common::now_rfc3339() : legacy.added);
      }
      existing = state.value().get(name);
      if (!legacy.last_synced.empty() && existing->last_synced.empty()) {
        state.value().set_last_synced(name, legacy.source_id, legacy.last_synced);
      }
    }
    auto saved = state.value().save(repo_root);
    if (!saved.ok()) {
      return common::Result<Manifest>::failure("failed to migrate manifest: " + saved.error());
    }
  }

  if (manifest.ids_generated_ || !manifest.legacy_timestamps_.empty()) {
    auto saved = manifest.save(repo_root);
    if (!saved.ok()) {
      observability::record_warning("manifest", "could not persist migrated manifest at " +
                                                    path.string() + ": " + saved.error());
    }
    manifest.legacy_timestamps_.clear();
    manifest.ids_generated_ = false;
  }
  return common::Result<Manifest>::success(std::move(manifest));
}

std::string Manifest::to_yaml() const {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "version" << YAML::Value << version_;
  out << YAML::Key << "sources" << YAML::Value << YAML::BeginSeq;
  for (const auto &source : sources_) {
    out << YAML::BeginMap;
    if (!source.id.empty()) {
      out << YAML::Key << "id" << YAML::Value << source.id;
    }
    out << YAML::Key << "name" << YAML::Value << source.name;
    if (!source.path.empty()) {
      out << YAML::Key << "path" << YAML::Value << source.path;
    }
    if (!source.url.empty()) {
      out << YAML::Key << "url" << YAML::Value << source.url;
    }
    if (!source.ref.empty()) {
      out << YAML::Key << "ref" << YAML::Value << source.ref;
    }
    if (!source.subpath.empty()) {
      out << YAML::Key << "subpath" << YAML::Value << source.subpath;
    }
    if (!source.mode.empty()) {
      out << YAML::Key << "mode" << YAML::Value << source.mode;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

common::Status Manifest::save(const std::filesystem::path &repo_root) const {
  auto status = validate();
  if (!status.ok()) {
    return common::Status::error("invalid manifest: " + status.error());
  }
  auto written = common::write_file(repo_root / MANIFEST_FILE, to_yaml());
  if (!written.ok()) {
    return common::Status::error("failed to write manifest: " + written.error());
  }
  return common::Status::success();
}

common::Status Manifest::validate() const {
  if (version_ != MANIFEST_VERSION) {
    return common::Status::error("invalid version: " + std::to_string(version_) +
                                 " (expected 1)");
  }
  std::set<std::string> names;
  std::set<std::string> ids;
  for (const auto &source : sources_) {
    auto status = validate_source(source);
    if (!status.ok()) {
      return common::Status::error("invalid source '" + source.name + "': " + status.error());
    }
    if (!names.insert(source.name).second) {
      return common::Status::error("duplicate source name: " + source.name);
    }
    if (!source.id.empty() && !ids.insert(source.id).second) {
      return common::Status::error("duplicate source ID: " + source.id);
    }
  }
  return common::Status::success();
}

common::Result<Source> Manifest::add_source(Source source) {
  if (source.id.empty()) {
    source.id = generate_source_id(source);
  }

  if (source.name.empty()) {
    const std::string base = generate_source_name(source);
    source.name = base;
    for (int n = 2; has_source(source.name); ++n) {
      source.name = with_suffix(base, n);
    }
  }

  auto status = validate_source(source);
  if (!status.ok()) {
    return common::Result<Source>::failure("invalid source: " + status.error());
  }

  for (const auto &existing : sources_) {
    if (!source.id.empty() && existing.id == source.id) {
      return common::Result<Source>::failure("source with same location already exists as '" +
                                             existing.name + "' (ID: " + existing.id + ")");
    }
    if (existing.name == source.name) {
      return common::Result<Source>::failure("source with name '" + source.name +
                                             "' already exists");
    }
  }

  sources_.push_back(source);
  return common::Result<Source>::success(std::move(source));
}

std::ptrdiff_t Manifest::find_index(const std::string &key) const {
  if (key.empty()) {
    return -1;
  }
  const auto find_by = [this](auto matches) -> std::ptrdiff_t {
    for (std::size_t i = 0; i < sources_.size(); ++i) {
      if (matches(sources_[i])) {
        return static_cast<std::ptrdiff_t>(i);
      }
    }
    return -1;
  };

  for (const auto index : {find_by([&](const Source &s) { return s.name == key; }),
                           find_by([&](const Source &s) { return s.path == key; }),
                           find_by([&](const Source &s) { return s.url == key; }),
                           find_by([&](const Source &s) { return s.id == key; })}) {
    if (index >= 0) {
      return index;
    }
  }
  return -1;
}

common::Result<Source> Manifest::remove_source(const std::string &key) {
  if (key.empty()) {
    return common::Result<Source>::failure("source name, path or URL cannot be empty");
  }
  const auto index = find_index(key);
  if (index < 0) {
    return common::Result<Source>::failure("source not found: " + key);
  }
  Source removed = sources_[static_cast<std::size_t>(index)];
  sources_.erase(sources_.begin() + index);
  return common::Result<Source>::success(std::move(removed));
}

const Source *Manifest::get_source(const std::string &key) const {
  const auto index = find_index(key);
  return index < 0 ? nullptr : &sources_[static_cast<std::size_t>(index)];
}

bool Manifest::has_source(const std::string &key) const { return find_index(key) >= 0; }

} // namespace aimgr::manifest
