#pragma once

#include "llmgate/common/json.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace llmgate::providers {

/// Per-attempt request settings. `extra` carries vendor specific fields such as
/// `system` or credentials; it is redacted before hashing or persisting.
struct CallParameters {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<std::uint64_t> max_tokens;
  common::JsonValue::Object extra;

  [[nodiscard]] common::JsonValue to_json() const;

  bool operator==(const CallParameters &other) const = default;
};

struct ProviderHandle {
  std::string provider;
  std::string model;
  std::size_t chain_index = 0;

  [[nodiscard]] std::string label() const;

  bool operator==(const ProviderHandle &other) const = default;
};

struct StreamUsage {
  std::optional<std::uint64_t> prompt_tokens;
  std::optional<std::uint64_t> completion_tokens;
  std::optional<double> cost_usd;
};

struct TokenEvent {
  std::string delta;
  StreamUsage usage;
};

struct CompleteEvent {
  std::optional<std::string> finish_reason;
  StreamUsage usage;
};

struct StreamErrorEvent {
  std::string message;
  bool retryable = false;
  std::string category = "provider_error";
  bool violation = false;
};

using ProviderEvent = std::variant<TokenEvent, CompleteEvent, StreamErrorEvent>;

[[nodiscard]] inline bool is_terminal(const ProviderEvent &event) {
  return !std::holds_alternative<TokenEvent>(event);
}

struct CallMetadata {
  std::string run_id;
  std::string trace_id;
  std::uint32_t attempt = 1;
};

} // namespace llmgate::providers
