#pragma once

#include "llmgate/audit/artifact_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>

namespace llmgate::audit {

class SqliteArtifactStore final : public IArtifactStore {
public:
  explicit SqliteArtifactStore(std::filesystem::path db_path);
  ~SqliteArtifactStore() override;

  SqliteArtifactStore(const SqliteArtifactStore &) = delete;
  SqliteArtifactStore &operator=(const SqliteArtifactStore &) = delete;

  [[nodiscard]] common::Result<std::string> put(const std::string &run_id,
                                                const std::string &path, const std::string &data,
                                                const std::string &content_type) override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] common::Result<std::optional<StoredArtifact>> get(const std::string &run_id,
                                                                  const std::string &path);
  [[nodiscard]] common::Result<std::size_t> count(const std::string &run_id);
  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace llmgate::audit
