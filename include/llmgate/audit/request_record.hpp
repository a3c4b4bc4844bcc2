#pragma once

#include "llmgate/common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace llmgate::audit {

/// Redacted description of an outbound request. Holds hashes only, never the
/// prompt, instructions or credential values.
struct RequestAuditRecord {
  std::string trace_id;
  std::string run_id;
  std::string provider;
  std::string model;
  common::JsonValue params;
  std::string prompt_hash;
  std::optional<std::string> instructions_hash;
  std::optional<std::string> context_hash;
  std::string created_at;

  [[nodiscard]] common::JsonValue to_json() const;
  [[nodiscard]] std::string serialize() const { return to_json().dump_pretty(2); }
};

/// `artifacts/llm/{run_id}/{sequence:04d}/request.json`
[[nodiscard]] std::string request_artifact_path(const std::string &run_id, std::uint64_t sequence);

} // namespace llmgate::audit
