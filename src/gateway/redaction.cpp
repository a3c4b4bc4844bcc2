#include "llmgate/gateway/redaction.hpp"

#include "llmgate/common/fs.hpp"
#include "llmgate/common/hash.hpp"

#include <array>

namespace llmgate::gateway {

namespace {

constexpr std::array<std::string_view, 4> SECRET_MARKERS = {"key", "secret", "token", "password"};
constexpr std::array<const char *, 3> INSTRUCTION_KEYS = {"system", "system_prompt", "instructions"};

} // namespace

bool is_secret_key(const std::string_view key) {
  const std::string lowered = common::to_lower(std::string(key));
  for (const auto marker : SECRET_MARKERS) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

common::JsonValue redact(const common::JsonValue &value) {
  if (value.is_object()) {
    common::JsonValue::Object out;
    for (const auto &[key, member] : value.as_object()) {
      out.emplace(key, is_secret_key(key) ? common::JsonValue(REDACTION_MASK) : redact(member));
    }
    return common::JsonValue(std::move(out));
  }
  if (value.is_array()) {
    common::JsonValue::Array out;
    out.reserve(value.as_array().size());
    for (const auto &item : value.as_array()) {
      out.push_back(redact(item));
    }
    return common::JsonValue(std::move(out));
  }
  return value;
}

common::JsonValue redacted_params(const providers::CallParameters &params) {
  return redact(params.to_json());
}

std::string params_hash(const providers::CallParameters &params) {
  return common::hash_json(redacted_params(params));
}

std::string prompt_hash(const std::string &prompt) {
  const auto hashed = common::hash_text(prompt);
  if (hashed.has_value()) {
    return *hashed;
  }
  return std::string(common::HASH_ALGORITHM_TAG) + common::sha256_hex("");
}

std::optional<std::string> instructions_hash(const providers::CallParameters &params) {
  for (const char *key : INSTRUCTION_KEYS) {
    const auto it = params.extra.find(key);
    if (it != params.extra.end() && it->second.is_string()) {
      return common::hash_text(it->second.as_string());
    }
  }
  return std::nullopt;
}

} // namespace llmgate::gateway
