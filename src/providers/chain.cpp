#include "llmgate/providers/chain.hpp"

#include "llmgate/common/fs.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace llmgate::providers {

namespace {

constexpr std::array<std::string_view, 7> BUILTIN_PROVIDERS = {
    "openai", "anthropic", "google", "azure", "bedrock", "ollama", "echo",
};

std::string normalize_provider(const std::string &name) {
  return common::to_lower(common::trim(name));
}

std::string resolve_model(const std::string &provider, const std::optional<std::string> &explicit_model,
                          const config::Config &config) {
  if (explicit_model.has_value() && !common::trim(*explicit_model).empty()) {
    return common::trim(*explicit_model);
  }
  const auto provider_it = config.providers.find(provider);
  if (provider_it != config.providers.end() && !provider_it->second.default_model.empty()) {
    return provider_it->second.default_model;
  }
  if (provider == normalize_provider(config.llm_gateway.default_provider)) {
    return config.llm_gateway.default_model;
  }
  return "";
}

void append_unique(ProviderChain &chain, std::string provider, std::string model) {
  const bool duplicate = std::any_of(chain.begin(), chain.end(), [&](const ProviderHandle &h) {
    return h.provider == provider && h.model == model;
  });
  if (duplicate) {
    return;
  }
  chain.push_back(ProviderHandle{
      .provider = std::move(provider), .model = std::move(model), .chain_index = chain.size()});
}

} // namespace

bool is_known_provider(const std::string &name, const config::Config &config) {
  const std::string key = normalize_provider(name);
  if (key.empty()) {
    return false;
  }
  if (std::find(BUILTIN_PROVIDERS.begin(), BUILTIN_PROVIDERS.end(), key) !=
      BUILTIN_PROVIDERS.end()) {
    return true;
  }
  if (config.providers.contains(key) ||
      key == normalize_provider(config.llm_gateway.default_provider)) {
    return true;
  }
  return std::any_of(config.llm_gateway.provider_chain.begin(),
                     config.llm_gateway.provider_chain.end(),
                     [&](const config::ProviderFallback &entry) {
                       return normalize_provider(entry.provider) == key;
                     });
}

std::optional<std::string> provider_hint(const CallParameters &params) {
  const bool has_provider = params.provider.has_value() && !common::trim(*params.provider).empty();
  const bool has_model = params.model.has_value() && !common::trim(*params.model).empty();
  if (has_provider && has_model) {
    return common::trim(*params.provider) + ":" + common::trim(*params.model);
  }
  if (has_provider) {
    return common::trim(*params.provider);
  }
  if (has_model) {
    return common::trim(*params.model);
  }
  return std::nullopt;
}

common::Result<ProviderChain, gateway::GatewayError>
resolve_provider_chain(const std::optional<std::string> &hint, const config::Config &config) {
  std::string primary_provider = normalize_provider(config.llm_gateway.default_provider);
  std::optional<std::string> primary_model;

  const std::string trimmed_hint = hint.has_value() ? common::trim(*hint) : "";
  if (!trimmed_hint.empty()) {
    const auto colon = trimmed_hint.find(':');
    if (colon != std::string::npos) {
      const std::string provider = normalize_provider(trimmed_hint.substr(0, colon));
      const std::string model = common::trim(trimmed_hint.substr(colon + 1));
      if (provider.empty()) {
        return common::Result<ProviderChain, gateway::GatewayError>::failure(
            gateway::GatewayError::configuration("provider hint has no provider: " + trimmed_hint));
      }
      primary_provider = provider;
      if (!model.empty()) {
        primary_model = model;
      }
    } else if (is_known_provider(trimmed_hint, config)) {
      primary_provider = normalize_provider(trimmed_hint);
    } else {
      primary_model = trimmed_hint;
    }
  }

  ProviderChain chain;
  if (!primary_provider.empty()) {
    append_unique(chain, primary_provider, resolve_model(primary_provider, primary_model, config));
  }
  for (const auto &entry : config.llm_gateway.provider_chain) {
    const std::string provider = normalize_provider(entry.provider);
    if (provider.empty()) {
      continue;
    }
    append_unique(chain, provider, resolve_model(provider, entry.model, config));
  }

  if (chain.empty()) {
    return common::Result<ProviderChain, gateway::GatewayError>::failure(
        gateway::GatewayError::configuration("provider chain is empty"));
  }
  return common::Result<ProviderChain, gateway::GatewayError>::success(std::move(chain));
}

std::vector<std::string> chain_labels(const ProviderChain &chain) {
  std::vector<std::string> labels;
  labels.reserve(chain.size());
  for (const auto &handle : chain) {
    labels.push_back(handle.label());
  }
  return labels;
}

} // namespace llmgate::providers
