#include "llmgate/audit/sqlite_store.hpp"

#include "llmgate/common/fs.hpp"

namespace llmgate::audit {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

} // namespace

SqliteArtifactStore::SqliteArtifactStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteArtifactStore::~SqliteArtifactStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteArtifactStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("artifact db not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS artifacts (
  run_id TEXT NOT NULL,
  path TEXT NOT NULL,
  content_type TEXT NOT NULL,
  data BLOB NOT NULL,
  created_at TEXT NOT NULL,
  PRIMARY KEY (run_id, path)
);
)");
}

common::Result<std::string> SqliteArtifactStore::put(const std::string &run_id,
                                                     const std::string &path,
                                                     const std::string &data,
                                                     const std::string &content_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::string>::failure("artifact db not initialized: " +
                                                db_path_.string());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO artifacts(run_id, path, content_type, data, created_at) "
      "VALUES(?1, ?2, ?3, ?4, ?5) "
      "ON CONFLICT(run_id, path) DO UPDATE SET content_type = excluded.content_type, "
      "data = excluded.data, created_at = excluded.created_at";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::string>::failure(sqlite3_errmsg(db_));
  }

  const std::string created_at = common::utc_timestamp_iso8601();
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, content_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 4, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::string>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::string>::success("sqlite://" + db_path_.string() + "#" + run_id +
                                              "/" + path);
}

common::Result<std::optional<StoredArtifact>>
SqliteArtifactStore::get(const std::string &run_id, const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<StoredArtifact>>::failure("artifact db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT data, content_type FROM artifacts WHERE run_id = ?1 AND path = ?2",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<StoredArtifact>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<StoredArtifact> out;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    StoredArtifact artifact;
    const auto *blob = static_cast<const char *>(sqlite3_column_blob(stmt, 0));
    const int size = sqlite3_column_bytes(stmt, 0);
    if (blob != nullptr && size > 0) {
      artifact.data.assign(blob, static_cast<std::size_t>(size));
    }
    const auto *type = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
    if (type != nullptr) {
      artifact.content_type = type;
    }
    out = std::move(artifact);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::optional<StoredArtifact>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<StoredArtifact>>::success(std::move(out));
}

common::Result<std::size_t> SqliteArtifactStore::count(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("artifact db not initialized");
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM artifacts WHERE run_id = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace llmgate::audit
