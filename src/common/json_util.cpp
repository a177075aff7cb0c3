#include "aimgr/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>

namespace aimgr::common {

namespace {

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::size_t scan_literal_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int code_point = 0;
      if (i + 4 < raw.size()) {
        const char *first = raw.data() + i + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code_point, 16);
        if (ec == std::errc() && ptr == first + 4) {
          append_utf8(out, code_point);
          i += 4;
          break;
        }
      }
      out.push_back('u');
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                     const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

JsonMembers json_parse_members(const std::string &json) {
  JsonMembers result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scan_literal_end(json, pos);
      result[key] = json.substr(pos, end - pos);
      pos = end;
    }
  }

  return result;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto members = json_parse_members(json);
  const auto it = members.find(field);
  if (it == members.end() || it->second == "null") {
    return "";
  }
  return it->second;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto members = json_parse_members(json);
  const auto it = members.find(field);
  if (it == members.end() || it->second.empty() || it->second.front() != '{') {
    return "";
  }
  return it->second;
}

long long json_get_int(const std::string &json, const std::string &field,
                       const long long fallback) {
  const auto members = json_parse_members(json);
  const auto it = members.find(field);
  if (it == members.end()) {
    return fallback;
  }
  long long parsed = 0;
  const auto *first = it->second.data();
  const auto *last = first + it->second.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const auto members = json_parse_members(json);
  const auto it = members.find(field);
  if (it == members.end() || it->second.empty() || it->second.front() != '[') {
    return {};
  }
  const std::string &array_str = it->second;

  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_str[pos] == '"') {
      const auto end = json_find_string_end(array_str, pos);
      if (end == std::string::npos || end <= pos) {
        break;
      }
      out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << '"' << json_escape(values[i]) << '"';
  }
  out << ']';
  return out.str();
}

} // namespace aimgr::common
