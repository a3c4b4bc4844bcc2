#include "llmgate/audit/factory.hpp"

#include "llmgate/audit/filesystem_store.hpp"
#include "llmgate/audit/sqlite_store.hpp"
#include "llmgate/common/fs.hpp"

namespace llmgate::audit {

common::Result<std::shared_ptr<IArtifactStore>> create_artifact_store(const config::Config &config) {
  using StoreResult = common::Result<std::shared_ptr<IArtifactStore>>;
  const std::string backend = common::to_lower(common::trim(config.artifacts.backend));
  if (!config.artifacts.enabled || backend == "none") {
    return StoreResult::success(nullptr);
  }

  const std::filesystem::path root = common::expand_path(config.artifacts.root);
  if (backend == "memory") {
    return StoreResult::success(std::make_shared<MemoryArtifactStore>());
  }
  if (backend.empty() || backend == "filesystem") {
    return StoreResult::success(std::make_shared<FilesystemArtifactStore>(root));
  }
  if (backend == "sqlite") {
    auto store = std::make_shared<SqliteArtifactStore>(root / "artifacts" / "audit.db");
    if (!store->is_open()) {
      return StoreResult::failure("failed to open sqlite artifact store under " + root.string());
    }
    return StoreResult::success(std::move(store));
  }
  return StoreResult::failure("unknown artifacts backend: " + config.artifacts.backend);
}

} // namespace llmgate::audit
