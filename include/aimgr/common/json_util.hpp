#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace aimgr::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                   char open_ch, char close_ch);

using JsonMembers = std::map<std::string, std::string>;
[[nodiscard]] JsonMembers json_parse_members(const std::string &json);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] long long json_get_int(const std::string &json, const std::string &field,
                                     long long fallback = 0);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                             const std::string &field);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace aimgr::common
