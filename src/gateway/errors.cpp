#include "llmgate/gateway/errors.hpp"

#include <algorithm>
#include <sstream>

namespace llmgate::gateway {

std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Provider:
    return "ProviderError";
  case ErrorKind::RetryableProvider:
    return "RetryableProviderError";
  case ErrorKind::CapExceeded:
    return "CapExceededError";
  case ErrorKind::AllProvidersExhausted:
    return "AllProvidersExhausted";
  case ErrorKind::Configuration:
    return "ConfigurationError";
  case ErrorKind::AuditFailure:
    return "AuditFailure";
  }
  return "ProviderError";
}

bool is_failover_category(const std::string_view category) {
  return std::find(FAILOVER_CATEGORIES.begin(), FAILOVER_CATEGORIES.end(), category) !=
         FAILOVER_CATEGORIES.end();
}

std::string GatewayError::to_string() const {
  std::ostringstream out;
  out << gateway::to_string(kind) << " [" << category << "]: " << message;
  if (retryable) {
    out << " (retryable)";
  }
  if (violation) {
    out << " (violation)";
  }
  if (cause != nullptr) {
    out << "; last error: " << cause->message;
  }
  return out.str();
}

GatewayError GatewayError::provider(std::string message, std::string category,
                                    const bool retryable, const bool violation) {
  GatewayError error;
  error.kind = ErrorKind::Provider;
  error.message = std::move(message);
  error.category = category.empty() ? std::string(CATEGORY_PROVIDER_ERROR) : std::move(category);
  error.retryable = retryable;
  error.violation = violation;
  return error;
}

GatewayError GatewayError::retryable_provider(std::string message, std::string category) {
  GatewayError error;
  error.kind = ErrorKind::RetryableProvider;
  error.message = std::move(message);
  error.category = category.empty() ? std::string(CATEGORY_TRANSIENT) : std::move(category);
  error.retryable = true;
  error.violation = false;
  return error;
}

GatewayError GatewayError::cap_exceeded(std::string message, std::string category) {
  GatewayError error;
  error.kind = ErrorKind::CapExceeded;
  error.message = std::move(message);
  error.category = category.empty() ? std::string(CATEGORY_CAP_EXCEEDED) : std::move(category);
  error.retryable = false;
  error.violation = true;
  return error;
}

GatewayError GatewayError::all_providers_exhausted(std::vector<std::string> attempted,
                                                   std::optional<GatewayError> last_error) {
  GatewayError error;
  error.kind = ErrorKind::AllProvidersExhausted;
  std::ostringstream message;
  message << "all providers exhausted:";
  for (const auto &label : attempted) {
    message << ' ' << label;
  }
  error.message = message.str();
  error.category = std::string(CATEGORY_EXHAUSTED);
  error.attempted = std::move(attempted);
  if (last_error.has_value()) {
    error.cause = std::make_shared<const GatewayError>(std::move(*last_error));
  }
  return error;
}

GatewayError GatewayError::configuration(std::string message) {
  GatewayError error;
  error.kind = ErrorKind::Configuration;
  error.message = std::move(message);
  error.category = std::string(CATEGORY_CONFIGURATION);
  return error;
}

GatewayError GatewayError::audit_failure(std::string message) {
  GatewayError error;
  error.kind = ErrorKind::AuditFailure;
  error.message = std::move(message);
  error.category = std::string(CATEGORY_AUDIT_FAILURE);
  return error;
}

} // namespace llmgate::gateway
