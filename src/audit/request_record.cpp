#include "llmgate/audit/request_record.hpp"

#include <iomanip>
#include <sstream>

namespace llmgate::audit {

namespace {

common::JsonValue optional_string(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return common::JsonValue();
  }
  return common::JsonValue(*value);
}

} // namespace

common::JsonValue RequestAuditRecord::to_json() const {
  common::JsonValue out = common::JsonValue::object();
  out["traceId"] = trace_id;
  out["runId"] = run_id;
  out["provider"] = provider;
  out["model"] = model.empty() ? common::JsonValue() : common::JsonValue(model);
  out["params"] = params;
  out["promptHash"] = prompt_hash;
  out["instructionsHash"] = optional_string(instructions_hash);
  out["contextHash"] = optional_string(context_hash);
  out["createdAt"] = created_at;
  return out;
}

std::string request_artifact_path(const std::string &run_id, const std::uint64_t sequence) {
  std::ostringstream out;
  out << "artifacts/llm/" << run_id << "/" << std::setw(4) << std::setfill('0') << sequence
      << "/request.json";
  return out.str();
}

} // namespace llmgate::audit
