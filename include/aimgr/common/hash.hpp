#pragma once

#include <string>

namespace aimgr::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace aimgr::common
