#include "llmgate/providers/registry.hpp"

#include "llmgate/common/fs.hpp"

#include <algorithm>
#include <mutex>

namespace llmgate::providers {

void AdapterRegistry::register_adapter(const std::string &provider,
                                       std::shared_ptr<IStreamAdapter> adapter) {
  const std::string key = common::to_lower(common::trim(provider));
  std::unique_lock<std::shared_mutex> lock(mutex_);
  adapters_[key] = std::move(adapter);
}

bool AdapterRegistry::unregister_adapter(const std::string &provider) {
  const std::string key = common::to_lower(common::trim(provider));
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return adapters_.erase(key) > 0;
}

std::shared_ptr<IStreamAdapter> AdapterRegistry::find(const std::string &provider) const {
  const std::string key = common::to_lower(common::trim(provider));
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = adapters_.find(key);
  if (it == adapters_.end()) {
    return nullptr;
  }
  return it->second;
}

bool AdapterRegistry::contains(const std::string &provider) const {
  return find(provider) != nullptr;
}

std::vector<std::string> AdapterRegistry::names() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(adapters_.size());
  for (const auto &[name, adapter] : adapters_) {
    (void)adapter;
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t AdapterRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return adapters_.size();
}

} // namespace llmgate::providers
