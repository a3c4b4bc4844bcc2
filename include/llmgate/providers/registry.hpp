#pragma once

#include "llmgate/providers/stream.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgate::providers {

/// Stream adapters keyed by lower-cased provider name. Registration may happen while
/// calls are reading from the registry.
class AdapterRegistry {
public:
  void register_adapter(const std::string &provider, std::shared_ptr<IStreamAdapter> adapter);
  bool unregister_adapter(const std::string &provider);

  [[nodiscard]] std::shared_ptr<IStreamAdapter> find(const std::string &provider) const;
  [[nodiscard]] bool contains(const std::string &provider) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<IStreamAdapter>> adapters_;
};

} // namespace llmgate::providers
