#pragma once

#include "llmgate/audit/artifact_store.hpp"

#include <filesystem>
#include <mutex>

namespace llmgate::audit {

/// Writes each artifact to `<root>/<path>` via temp file + rename. Paths that would
/// escape the root are rejected.
class FilesystemArtifactStore final : public IArtifactStore {
public:
  explicit FilesystemArtifactStore(std::filesystem::path root);

  [[nodiscard]] common::Result<std::string> put(const std::string &run_id,
                                                const std::string &path, const std::string &data,
                                                const std::string &content_type) override;
  [[nodiscard]] std::string_view name() const override { return "filesystem"; }

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  std::mutex mutex_;
};

} // namespace llmgate::audit
