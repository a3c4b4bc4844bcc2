#pragma once

#include "llmgate/providers/stream.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace llmgate::providers {

/// Development adapter: streams the prompt back one word per token from a producer
/// thread. Lets the CLI and tests exercise the full call path without a vendor.
class EchoStreamAdapter final : public IStreamAdapter {
public:
  struct Options {
    std::chrono::milliseconds token_delay{0};
    std::size_t channel_capacity = 16;
    std::optional<double> cost_per_token_usd;
  };

  EchoStreamAdapter();
  explicit EchoStreamAdapter(Options options);

  [[nodiscard]] common::Result<ProviderStream, gateway::GatewayError>
  open_stream(const std::string &prompt, const CallParameters &params,
              const ProviderHandle &handle, const CallMetadata &metadata) override;

private:
  Options options_;
};

} // namespace llmgate::providers
