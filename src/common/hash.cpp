#include "aimgr/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace aimgr::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

} // namespace aimgr::common
