#include "llmgate/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace llmgate::common {

std::string sha256_hex(const std::string &data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::optional<std::string> hash_text(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  return std::string(HASH_ALGORITHM_TAG) + sha256_hex(text);
}

std::string hash_json(const JsonValue &value) {
  return std::string(HASH_ALGORITHM_TAG) + sha256_hex(value.dump());
}

} // namespace llmgate::common
