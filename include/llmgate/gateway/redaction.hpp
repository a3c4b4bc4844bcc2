#pragma once

#include "llmgate/common/json.hpp"
#include "llmgate/providers/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace llmgate::gateway {

inline constexpr const char *REDACTION_MASK = "***";

/// True when the lower-cased key contains `key`, `secret`, `token` or `password`.
[[nodiscard]] bool is_secret_key(std::string_view key);

/// Copy of `value` with every secret-looking member masked, at any depth.
[[nodiscard]] common::JsonValue redact(const common::JsonValue &value);

[[nodiscard]] common::JsonValue redacted_params(const providers::CallParameters &params);
[[nodiscard]] std::string params_hash(const providers::CallParameters &params);

/// Hash of the prompt bytes. An empty prompt still gets the digest of no bytes.
[[nodiscard]] std::string prompt_hash(const std::string &prompt);

/// Hash of the first string found in `extra.system`, `extra.system_prompt` or
/// `extra.instructions`.
[[nodiscard]] std::optional<std::string> instructions_hash(const providers::CallParameters &params);

} // namespace llmgate::gateway
