#include "aimgr/resource/frontmatter.hpp"

#include "aimgr/common/fs.hpp"

#include <yaml-cpp/yaml.h>

namespace aimgr::resource {

namespace {

// Finds the closing `---` line at or after `start`. On success `block_end` is the
// offset of that line and the return value is the offset of the body.
std::size_t find_block_end(const std::string &content, const std::size_t start,
                           std::size_t &block_end) {
  std::size_t pos = start;
  while (pos <= content.size()) {
    const std::size_t eol = content.find('\n', pos);
    std::string line =
        content.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line == "---") {
      block_end = pos;
      return eol == std::string::npos ? content.size() : eol + 1;
    }
    if (eol == std::string::npos) {
      break;
    }
    pos = eol + 1;
  }
  return std::string::npos;
}

} // namespace

bool Frontmatter::has(const std::string &key) const {
  return values.contains(key) || lists.contains(key);
}

std::string Frontmatter::get(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : it->second;
}

common::Result<Frontmatter> parse_frontmatter(const std::string &content) {
  Frontmatter fm;
  fm.body = content;

  std::size_t header_end = 0;
  if (common::starts_with(content, "---\n")) {
    header_end = 4;
  } else if (common::starts_with(content, "---\r\n")) {
    header_end = 5;
  } else {
    return common::Result<Frontmatter>::success(std::move(fm));
  }

  std::size_t block_end = 0;
  const std::size_t body_start = find_block_end(content, header_end, block_end);
  if (body_start == std::string::npos) {
    return common::Result<Frontmatter>::failure("unterminated frontmatter block");
  }

  const std::string block = content.substr(header_end, block_end - header_end);
  fm.body = content.substr(body_start);
  fm.present = true;

  try {
    const YAML::Node root = YAML::Load(block);
    if (!root || root.IsNull()) {
      return common::Result<Frontmatter>::success(std::move(fm));
    }
    if (!root.IsMap()) {
      return common::Result<Frontmatter>::failure("frontmatter must be a YAML mapping");
    }
    for (const auto &entry : root) {
      const std::string key = entry.first.as<std::string>();
      const YAML::Node &value = entry.second;
      if (value.IsScalar()) {
        fm.values[key] = value.as<std::string>();
      } else if (value.IsSequence()) {
        std::vector<std::string> items;
        std::string joined;
        for (const auto &item : value) {
          if (!item.IsScalar()) {
            continue;
          }
          items.push_back(item.as<std::string>());
          joined += (joined.empty() ? "" : ", ") + items.back();
        }
        fm.lists[key] = std::move(items);
        fm.values[key] = joined;
      } else if (value.IsNull()) {
        fm.values[key] = "";
      }
    }
  } catch (const YAML::Exception &ex) {
    return common::Result<Frontmatter>::failure(std::string("invalid frontmatter: ") + ex.what());
  }

  return common::Result<Frontmatter>::success(std::move(fm));
}

common::Result<Frontmatter> read_frontmatter(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Frontmatter>::failure(content.error());
  }
  return parse_frontmatter(content.value());
}

} // namespace aimgr::resource
