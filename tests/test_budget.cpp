#include "test_framework.hpp"

#include "llmgate/budget/active_time.hpp"
#include "llmgate/gateway/budget.hpp"
#include "llmgate/gateway/gateway.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

void register_budget_tests(std::vector<llmgate::tests::TestCase> &tests) {
  using llmgate::tests::require;
  namespace gw = llmgate::gateway;
  using llmgate::budget::ActiveTimeBudget;

  tests.push_back({"budget_word_count_estimator", [] {
                     const gw::WordCountEstimator estimator;
                     require(estimator.estimate("") == 0, "empty text");
                     require(estimator.estimate("   \n") == 0, "blank text");
                     require(estimator.estimate("hello") == 1, "single word");
                     require(estimator.estimate(" the quick  brown\tfox ") == 4, "four words");
                   }});

  tests.push_back({"budget_caps_take_the_tighter_token_limit", [] {
                     llmgate::config::LlmGatewayConfig config;
                     require(!gw::BudgetCaps::resolve(config, std::nullopt).tokens.has_value(),
                             "no caps configured");
                     require(gw::BudgetCaps::resolve(config, 64).tokens == std::optional<std::uint64_t>(64),
                             "call cap alone");
                     config.tokens_cap = 100;
                     require(gw::BudgetCaps::resolve(config, 64).tokens == std::optional<std::uint64_t>(64),
                             "call cap tighter");
                     require(gw::BudgetCaps::resolve(config, 500).tokens == std::optional<std::uint64_t>(100),
                             "global cap tighter");
                     config.cost_cap_usd = 0.25;
                     require(gw::BudgetCaps::resolve(config, std::nullopt).cost_usd ==
                                 std::optional<double>(0.25),
                             "cost cap passes through");
                   }});

  tests.push_back({"budget_enforcer_checks_tokens_before_cost", [] {
                     gw::BudgetEnforcer budget(gw::BudgetCaps{.tokens = 3, .cost_usd = 0.10});
                     require(budget.check() == gw::BudgetReason::None, "fresh budget");
                     budget.add_tokens(2);
                     budget.set_cost(0.05);
                     require(budget.check() == gw::BudgetReason::None, "under both caps");
                     budget.set_cost(0.10);
                     require(budget.check() == gw::BudgetReason::CostCap, "cost cap is inclusive");
                     budget.add_tokens(1);
                     require(budget.check() == gw::BudgetReason::TokenCap, "token cap reported first");
                     budget.set_tokens(1);
                     budget.set_cost(0.0);
                     require(budget.check() == gw::BudgetReason::None, "exact usage replaces estimates");
                   }});

  tests.push_back({"budget_enforcer_starts_from_initial_usage", [] {
                     gw::BudgetEnforcer budget(gw::BudgetCaps{.tokens = 5, .cost_usd = std::nullopt}, 5);
                     require(budget.check() == gw::BudgetReason::TokenCap, "initial usage counts");
                     require(std::string(gw::to_string(gw::BudgetReason::TokenCap)) == "token_cap",
                             "reason name");
                     require(std::string(gw::to_string(gw::BudgetReason::CostCap)) == "cost_cap",
                             "reason name");
                   }});

  tests.push_back({"active_time_accumulates_windows", [] {
                     ActiveTimeBudget budget(std::chrono::seconds(60));
                     require(!budget.running(), "idle at start");
                     require(budget.active_ms() == 0, "nothing billed yet");
                     {
                       const auto window = budget.track();
                       require(budget.running(), "window open");
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     }
                     require(!budget.running(), "window closed");
                     const auto billed = budget.active_ms();
                     require(billed >= 20, "window time billed");
                     std::this_thread::sleep_for(std::chrono::milliseconds(10));
                     require(budget.active_ms() == billed, "idle time is not billed");
                     const auto remaining = budget.remaining_seconds();
                     require(remaining.has_value() && *remaining < 60.0 && *remaining > 50.0,
                             "remaining time");
                     require(!budget.exceeded(), "limit not reached");
                   }});

  tests.push_back({"active_time_nested_windows_bill_once", [] {
                     ActiveTimeBudget budget;
                     budget.start();
                     budget.start();
                     std::this_thread::sleep_for(std::chrono::milliseconds(15));
                     budget.stop();
                     require(budget.running(), "outer window still open");
                     budget.stop();
                     budget.stop();
                     require(!budget.running(), "extra stop is ignored");
                     const auto billed = budget.active_ms();
                     require(billed >= 15 && billed < 1000, "overlap billed once");
                     require(!budget.remaining_seconds().has_value(), "unlimited budget");
                     require(!budget.exceeded(), "unlimited never exceeds");
                   }});

  tests.push_back({"active_time_zero_limit_is_exceeded", [] {
                     ActiveTimeBudget budget(std::chrono::seconds(0));
                     require(budget.exceeded(), "zero limit is exhausted immediately");
                     require(*budget.remaining_seconds() == 0.0, "remaining clamps at zero");
                   }});

  tests.push_back({"active_time_hook_ignores_unknown_phases", [] {
                     auto budget = std::make_shared<ActiveTimeBudget>();
                     const auto hook = gw::active_time_hook(budget);
                     hook("run", "trace", "pause");
                     require(!budget->running(), "unknown phase ignored");
                     hook("run", "trace", "start");
                     hook("run", "trace", "stop");
                     require(!budget->running(), "start/stop pair closes window");

                     const auto null_hook = gw::active_time_hook(nullptr);
                     null_hook("run", "trace", "start");
                   }});
}
