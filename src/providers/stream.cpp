#include "llmgate/providers/stream.hpp"

namespace llmgate::providers {

SequenceEventSource::SequenceEventSource(std::vector<ProviderEvent> events)
    : events_(std::move(events)) {}

std::optional<ProviderEvent> SequenceEventSource::next() {
  if (terminated_ || position_ >= events_.size()) {
    return std::nullopt;
  }
  ProviderEvent event = events_[position_++];
  if (is_terminal(event)) {
    terminated_ = true;
  }
  return event;
}

FunctionStreamAdapter::FunctionStreamAdapter(OpenFn fn) : fn_(std::move(fn)) {}

common::Result<ProviderStream, gateway::GatewayError>
FunctionStreamAdapter::open_stream(const std::string &prompt, const CallParameters &params,
                                   const ProviderHandle &handle, const CallMetadata &metadata) {
  if (!fn_) {
    return common::Result<ProviderStream, gateway::GatewayError>::failure(
        gateway::GatewayError::provider("stream adapter has no open function",
                                        std::string(gateway::CATEGORY_PROVIDER_UNAVAILABLE)));
  }
  return fn_(prompt, params, handle, metadata);
}

ProviderStream make_sequence_stream(std::vector<ProviderEvent> events, StreamUsage usage) {
  ProviderStream stream;
  stream.events = std::make_unique<SequenceEventSource>(std::move(events));
  stream.usage = usage;
  return stream;
}

} // namespace llmgate::providers
