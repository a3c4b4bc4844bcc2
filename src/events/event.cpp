#include "llmgate/events/event.hpp"

namespace llmgate::events {

common::JsonValue LlmEvent::to_json() const {
  common::JsonValue out(fields);
  out["event"] = "llm";
  out["type"] = type;
  out["runId"] = run_id;
  return out;
}

const common::JsonValue *LlmEvent::field(const std::string &key) const {
  const auto it = fields.find(key);
  return it == fields.end() ? nullptr : &it->second;
}

} // namespace llmgate::events
