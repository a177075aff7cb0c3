#include "aimgr/manifest/source_state.hpp"

#include "aimgr/common/fs.hpp"
#include "aimgr/common/json_util.hpp"

#include <sstream>

namespace aimgr::manifest {

std::filesystem::path SourceState::path_for(const std::filesystem::path &repo_root) {
  return repo_root / ".metadata" / "sources.json";
}

common::Result<SourceState> SourceState::load(const std::filesystem::path &repo_root) {
  SourceState state;
  const auto path = path_for(repo_root);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<SourceState>::success(std::move(state));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<SourceState>::failure(content.error());
  }
  if (common::json_parse_members(content.value()).empty()) {
    return common::Result<SourceState>::failure("failed to parse source state: " +
                                                path.string());
  }

  const std::string sources = common::json_get_object(content.value(), "sources");
  for (const auto &[name, raw] : common::json_parse_members(sources)) {
    state.sources_[name] = SourceRecord{
        .source_id = common::json_get_string(raw, "source_id"),
        .added = common::json_get_string(raw, "added"),
        .last_synced = common::json_get_string(raw, "last_synced"),
    };
  }
  return common::Result<SourceState>::success(std::move(state));
}

common::Status SourceState::save(const std::filesystem::path &repo_root) const {
  std::ostringstream out;
  out << "{\n  \"version\": 1,\n  \"sources\": {";
  bool first = true;
  for (const auto &[name, record] : sources_) {
    out << (first ? "\n" : ",\n");
    first = false;
    out << "    \"" << common::json_escape(name) << "\": {";
    out << "\"source_id\": \"" << common::json_escape(record.source_id) << "\", ";
    out << "\"added\": \"" << common::json_escape(record.added) << "\"";
    if (!record.last_synced.empty()) {
      out << ", \"last_synced\": \"" << common::json_escape(record.last_synced) << "\"";
    }
    out << "}";
  }
  out << (first ? "}\n}\n" : "\n  }\n}\n");
  return common::write_file(path_for(repo_root), out.str());
}

const SourceRecord *SourceState::get(const std::string &name) const {
  const auto it = sources_.find(name);
  return it == sources_.end() ? nullptr : &it->second;
}

void SourceState::set_added(const std::string &name, const std::string &source_id,
                            const std::string &timestamp) {
  auto &record = sources_[name];
  if (!source_id.empty()) {
    record.source_id = source_id;
  }
  record.added = timestamp;
}

void SourceState::set_last_synced(const std::string &name, const std::string &source_id,
                                  const std::string &timestamp) {
  auto &record = sources_[name];
  if (!source_id.empty()) {
    record.source_id = source_id;
  }
  if (record.added.empty()) {
    record.added = timestamp;
  }
  record.last_synced = timestamp;
}

void SourceState::erase(const std::string &name) { sources_.erase(name); }

void SourceState::rename(const std::string &from, const std::string &to) {
  const auto it = sources_.find(from);
  if (it == sources_.end() || from == to) {
    return;
  }
  sources_[to] = it->second;
  sources_.erase(from);
}

} // namespace aimgr::manifest
