#pragma once

#include "llmgate/common/result.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace llmgate::audit {

inline constexpr const char *CONTENT_TYPE_JSON = "application/json";

/// Blob sink for audit records. `put` returns a locator for the stored artifact.
class IArtifactStore {
public:
  virtual ~IArtifactStore() = default;

  [[nodiscard]] virtual common::Result<std::string>
  put(const std::string &run_id, const std::string &path, const std::string &data,
      const std::string &content_type = CONTENT_TYPE_JSON) = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;
};

struct StoredArtifact {
  std::string data;
  std::string content_type;
};

class MemoryArtifactStore final : public IArtifactStore {
public:
  [[nodiscard]] common::Result<std::string> put(const std::string &run_id,
                                                const std::string &path, const std::string &data,
                                                const std::string &content_type) override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  [[nodiscard]] std::optional<StoredArtifact> get(const std::string &run_id,
                                                  const std::string &path) const;
  [[nodiscard]] std::vector<std::string> paths(const std::string &run_id) const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, StoredArtifact> artifacts_;
};

} // namespace llmgate::audit
