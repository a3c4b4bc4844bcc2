#pragma once

#include "llmgate/common/result.hpp"
#include "llmgate/gateway/errors.hpp"
#include "llmgate/providers/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::providers {

/// Single-pass pull iterator over provider events. `nullopt` means exhausted.
class IEventSource {
public:
  virtual ~IEventSource() = default;
  [[nodiscard]] virtual std::optional<ProviderEvent> next() = 0;
};

/// Replays a prepared list of events, stopping after the first terminal one.
class SequenceEventSource final : public IEventSource {
public:
  explicit SequenceEventSource(std::vector<ProviderEvent> events);

  [[nodiscard]] std::optional<ProviderEvent> next() override;

private:
  std::vector<ProviderEvent> events_;
  std::size_t position_ = 0;
  bool terminated_ = false;
};

struct ProviderStream {
  std::unique_ptr<IEventSource> events;
  /// Optional; must be safe to call more than once.
  std::function<void()> cancel;
  StreamUsage usage;
};

class IStreamAdapter {
public:
  virtual ~IStreamAdapter() = default;

  [[nodiscard]] virtual common::Result<ProviderStream, gateway::GatewayError>
  open_stream(const std::string &prompt, const CallParameters &params,
              const ProviderHandle &handle, const CallMetadata &metadata) = 0;
};

class FunctionStreamAdapter final : public IStreamAdapter {
public:
  using OpenFn = std::function<common::Result<ProviderStream, gateway::GatewayError>(
      const std::string &, const CallParameters &, const ProviderHandle &,
      const CallMetadata &)>;

  explicit FunctionStreamAdapter(OpenFn fn);

  [[nodiscard]] common::Result<ProviderStream, gateway::GatewayError>
  open_stream(const std::string &prompt, const CallParameters &params,
              const ProviderHandle &handle, const CallMetadata &metadata) override;

private:
  OpenFn fn_;
};

[[nodiscard]] ProviderStream make_sequence_stream(std::vector<ProviderEvent> events,
                                                  StreamUsage usage = {});

} // namespace llmgate::providers
