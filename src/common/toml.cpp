#include "aimgr/common/toml.hpp"

#include "aimgr/common/fs.hpp"

#include <sstream>

namespace aimgr::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if ((ch == '"' || ch == '\'') && (i == 0 || line[i - 1] != '\\')) {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  char quote = '\0';

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if ((ch == '"' || ch == '\'') && (i == 0 || array_value[i - 1] != '\\')) {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
      current.push_back(ch);
      continue;
    }

    if (quote == '\0' && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      if (value[i] == '\\' && i + 2 < value.size()) {
        ++i;
        out.push_back(value[i] == 'n' ? '\n' : value[i] == 't' ? '\t' : value[i]);
        continue;
      }
      out.push_back(value[i]);
    }
    return out;
  }
  return value;
}

int bracket_balance(const std::string &value) {
  int depth = 0;
  char quote = '\0';
  for (const char ch : value) {
    if (ch == '"' || ch == '\'') {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
      continue;
    }
    if (quote != '\0') {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("missing key at line " + std::to_string(line_number));
    }

    // Arrays may continue over several lines.
    const std::size_t start_line = line_number;
    while (bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure("unterminated array starting at line " +
                                             std::to_string(start_line));
      }
      ++line_number;
      value += " " + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

} // namespace aimgr::common
