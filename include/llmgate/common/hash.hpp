#pragma once

#include "llmgate/common/json.hpp"

#include <optional>
#include <string>

namespace llmgate::common {

inline constexpr const char *HASH_ALGORITHM_TAG = "sha256:";

[[nodiscard]] std::string sha256_hex(const std::string &data);

/// Tagged content hash over the UTF-8 bytes of `text`; empty text hashes to nullopt.
[[nodiscard]] std::optional<std::string> hash_text(const std::string &text);

[[nodiscard]] std::string hash_json(const JsonValue &value);

} // namespace llmgate::common
