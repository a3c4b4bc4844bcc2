#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::gateway {

enum class ErrorKind {
  Provider,
  RetryableProvider,
  CapExceeded,
  AllProvidersExhausted,
  Configuration,
  AuditFailure,
};

inline constexpr std::string_view CATEGORY_PROVIDER_ERROR = "provider_error";
inline constexpr std::string_view CATEGORY_PROVIDER_UNAVAILABLE = "provider_unavailable";
inline constexpr std::string_view CATEGORY_TRANSIENT = "transient";
inline constexpr std::string_view CATEGORY_CAP_EXCEEDED = "cap_exceeded";
inline constexpr std::string_view CATEGORY_BUDGET_EXHAUSTED = "budget_exhausted";
inline constexpr std::string_view CATEGORY_EXHAUSTED = "providers_exhausted";
inline constexpr std::string_view CATEGORY_CONFIGURATION = "configuration";
inline constexpr std::string_view CATEGORY_AUDIT_FAILURE = "audit_failure";

inline constexpr std::array<std::string_view, 8> FAILOVER_CATEGORIES = {
    "provider_error", "provider_unavailable", "quota_exceeded", "rate_limit",
    "timeout",        "server_error",         "transient",      "api_error",
};

struct GatewayError {
  ErrorKind kind = ErrorKind::Provider;
  std::string message;
  bool retryable = false;
  std::string category = std::string(CATEGORY_PROVIDER_ERROR);
  bool violation = false;
  /// `provider:model` labels in chain order, set for AllProvidersExhausted.
  std::vector<std::string> attempted;
  std::shared_ptr<const GatewayError> cause;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static GatewayError provider(std::string message,
                                             std::string category = std::string(
                                                 CATEGORY_PROVIDER_ERROR),
                                             bool retryable = false, bool violation = false);
  [[nodiscard]] static GatewayError retryable_provider(std::string message,
                                                       std::string category = std::string(
                                                           CATEGORY_TRANSIENT));
  [[nodiscard]] static GatewayError cap_exceeded(std::string message,
                                                 std::string category = std::string(
                                                     CATEGORY_CAP_EXCEEDED));
  [[nodiscard]] static GatewayError
  all_providers_exhausted(std::vector<std::string> attempted,
                          std::optional<GatewayError> last_error = std::nullopt);
  [[nodiscard]] static GatewayError configuration(std::string message);
  [[nodiscard]] static GatewayError audit_failure(std::string message);
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);
[[nodiscard]] bool is_failover_category(std::string_view category);

} // namespace llmgate::gateway
