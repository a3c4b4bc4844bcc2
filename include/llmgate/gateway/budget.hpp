#pragma once

#include "llmgate/config/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace llmgate::gateway {

/// Estimates token counts for text the provider did not meter.
class ITokenEstimator {
public:
  virtual ~ITokenEstimator() = default;
  [[nodiscard]] virtual std::uint64_t estimate(const std::string &text) const = 0;
};

/// Whitespace word count; blank text counts as zero, anything else as at least one.
class WordCountEstimator final : public ITokenEstimator {
public:
  [[nodiscard]] std::uint64_t estimate(const std::string &text) const override;
};

struct BudgetCaps {
  std::optional<std::uint64_t> tokens;
  std::optional<double> cost_usd;

  /// Global caps narrowed by the call's own `max_tokens`.
  [[nodiscard]] static BudgetCaps resolve(const config::LlmGatewayConfig &config,
                                          std::optional<std::uint64_t> max_tokens);
};

enum class BudgetReason { None, TokenCap, CostCap };

[[nodiscard]] const char *to_string(BudgetReason reason);

class BudgetEnforcer {
public:
  explicit BudgetEnforcer(BudgetCaps caps, std::uint64_t completion_tokens = 0,
                          double cost_usd = 0.0);

  void add_tokens(std::uint64_t tokens) { completion_tokens_ += tokens; }
  void set_tokens(std::uint64_t tokens) { completion_tokens_ = tokens; }
  void set_cost(double cost_usd) { cost_usd_ = cost_usd; }

  /// Token cap first, then cost cap.
  [[nodiscard]] BudgetReason check() const;

  [[nodiscard]] std::uint64_t completion_tokens() const { return completion_tokens_; }
  [[nodiscard]] double cost_usd() const { return cost_usd_; }
  [[nodiscard]] const BudgetCaps &caps() const { return caps_; }

private:
  BudgetCaps caps_;
  std::uint64_t completion_tokens_;
  double cost_usd_;
};

} // namespace llmgate::gateway
