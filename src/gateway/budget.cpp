#include "llmgate/gateway/budget.hpp"

#include "llmgate/common/fs.hpp"

#include <algorithm>

namespace llmgate::gateway {

std::uint64_t WordCountEstimator::estimate(const std::string &text) const {
  const auto words = common::split_whitespace(text);
  return static_cast<std::uint64_t>(words.size());
}

BudgetCaps BudgetCaps::resolve(const config::LlmGatewayConfig &config,
                               const std::optional<std::uint64_t> max_tokens) {
  BudgetCaps caps;
  caps.tokens = config.tokens_cap;
  if (max_tokens.has_value()) {
    caps.tokens = caps.tokens.has_value() ? std::min(*caps.tokens, *max_tokens) : *max_tokens;
  }
  caps.cost_usd = config.cost_cap_usd;
  return caps;
}

const char *to_string(const BudgetReason reason) {
  switch (reason) {
  case BudgetReason::None:
    return "none";
  case BudgetReason::TokenCap:
    return "token_cap";
  case BudgetReason::CostCap:
    return "cost_cap";
  }
  return "none";
}

BudgetEnforcer::BudgetEnforcer(BudgetCaps caps, const std::uint64_t completion_tokens,
                               const double cost_usd)
    : caps_(caps), completion_tokens_(completion_tokens), cost_usd_(cost_usd) {}

BudgetReason BudgetEnforcer::check() const {
  if (caps_.tokens.has_value() && completion_tokens_ >= *caps_.tokens) {
    return BudgetReason::TokenCap;
  }
  if (caps_.cost_usd.has_value() && cost_usd_ >= *caps_.cost_usd) {
    return BudgetReason::CostCap;
  }
  return BudgetReason::None;
}

} // namespace llmgate::gateway
