#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_config_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_policy_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_redaction_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_budget_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_provider_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_audit_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_events_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_observability_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_gateway_tests(std::vector<llmgate::tests::TestCase> &tests);
void register_gateway_integration_tests(std::vector<llmgate::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<llmgate::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_policy_tests(tests);
  register_redaction_tests(tests);
  register_budget_tests(tests);
  register_provider_tests(tests);
  register_audit_tests(tests);
  register_events_tests(tests);
  register_observability_tests(tests);
  register_gateway_tests(tests);
  register_gateway_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
