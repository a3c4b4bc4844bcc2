#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::config {

struct ProviderFallback {
  std::string provider;
  std::optional<std::string> model;
};

struct LlmGatewayConfig {
  std::string default_provider = "openai";
  std::string default_model;
  std::uint32_t retry_max = 2;
  std::uint64_t retry_backoff_base_ms = 200;
  std::uint64_t retry_backoff_jitter_ms = 100;
  std::optional<std::uint64_t> tokens_cap;
  std::optional<double> cost_cap_usd;
  std::vector<ProviderFallback> provider_chain;
};

struct ProviderConfig {
  std::string default_model;
};

struct ArtifactsConfig {
  bool enabled = true;
  std::string backend = "filesystem";
  std::string root = ".";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct EventsConfig {
  std::size_t max_queue_size = 256;
};

struct Config {
  LlmGatewayConfig llm_gateway;
  std::map<std::string, ProviderConfig> providers;
  ArtifactsConfig artifacts;
  ObservabilityConfig observability;
  EventsConfig events;
};

} // namespace llmgate::config
