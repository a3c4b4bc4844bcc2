#include "llmgate/providers/types.hpp"

namespace llmgate::providers {

common::JsonValue CallParameters::to_json() const {
  common::JsonValue out = common::JsonValue::object();
  if (provider.has_value()) {
    out["provider"] = *provider;
  }
  if (model.has_value()) {
    out["model"] = *model;
  }
  if (temperature.has_value()) {
    out["temperature"] = *temperature;
  }
  if (top_p.has_value()) {
    out["top_p"] = *top_p;
  }
  if (max_tokens.has_value()) {
    out["max_tokens"] = *max_tokens;
  }
  if (!extra.empty()) {
    out["extra"] = common::JsonValue(extra);
  }
  return out;
}

std::string ProviderHandle::label() const {
  if (model.empty()) {
    return provider;
  }
  return provider + ":" + model;
}

} // namespace llmgate::providers
