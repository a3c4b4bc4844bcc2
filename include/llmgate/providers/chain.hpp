#pragma once

#include "llmgate/common/result.hpp"
#include "llmgate/config/schema.hpp"
#include "llmgate/gateway/errors.hpp"
#include "llmgate/providers/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace llmgate::providers {

using ProviderChain = std::vector<ProviderHandle>;

/// Builds the ordered candidate list for one call. `hint` may be empty, `provider`,
/// `provider:model`, or a bare model name (applied to the default provider).
[[nodiscard]] common::Result<ProviderChain, gateway::GatewayError>
resolve_provider_chain(const std::optional<std::string> &hint, const config::Config &config);

[[nodiscard]] std::optional<std::string> provider_hint(const CallParameters &params);

[[nodiscard]] bool is_known_provider(const std::string &name, const config::Config &config);

[[nodiscard]] std::vector<std::string> chain_labels(const ProviderChain &chain);

} // namespace llmgate::providers
