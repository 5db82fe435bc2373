#include "warden/checkpoint/store.hpp"

#include "warden/common/crypto.hpp"
#include "warden/common/time.hpp"

namespace warden::checkpoint {

namespace {

constexpr const char *kNotInitialized = "checkpoint db not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::TransientInfra, message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return text == nullptr ? std::string() : std::string(text);
}

std::string column_blob(sqlite3_stmt *stmt, const int index) {
  const auto *data = static_cast<const char *>(sqlite3_column_blob(stmt, index));
  const int size = sqlite3_column_bytes(stmt, index);
  return data == nullptr ? std::string() : std::string(data, static_cast<std::size_t>(size));
}

CheckpointStatus status_from_column(const std::string &value) {
  return value == "failed" ? CheckpointStatus::Failed : CheckpointStatus::Active;
}

} // namespace

std::string checkpoint_status_to_string(const CheckpointStatus status) {
  return status == CheckpointStatus::Failed ? "failed" : "active";
}

SqliteCheckpointStore::SqliteCheckpointStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteCheckpointStore::~SqliteCheckpointStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteCheckpointStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  auto wal = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!wal.ok()) {
    return wal;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS checkpoints (
  session_id TEXT PRIMARY KEY,
  turn_index INTEGER NOT NULL,
  blob BLOB NOT NULL,
  checksum TEXT NOT NULL,
  status TEXT NOT NULL DEFAULT 'active',
  reason TEXT,
  updated_at TEXT NOT NULL
);
)");
}

common::Status SqliteCheckpointStore::save(const std::string &session_id,
                                           const std::int64_t turn_index,
                                           const std::string &blob) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  const char *sql =
      "INSERT INTO checkpoints(session_id, turn_index, blob, checksum, status, reason, updated_at) "
      "VALUES(?1, ?2, ?3, ?4, 'active', NULL, ?5) "
      "ON CONFLICT(session_id) DO UPDATE SET turn_index = excluded.turn_index, "
      "blob = excluded.blob, checksum = excluded.checksum, status = 'active', reason = NULL, "
      "updated_at = excluded.updated_at";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  const std::string checksum = common::sha256_hex(blob);
  const std::string updated_at = common::now_rfc3339();
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, turn_index);
  sqlite3_bind_blob(stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, checksum.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, updated_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::TransientInfra, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::optional<Checkpoint>>
SqliteCheckpointStore::load_latest(const std::string &session_id) {
  using R = common::Result<std::optional<Checkpoint>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT turn_index, blob, checksum, status, reason, updated_at "
                    "FROM checkpoints WHERE session_id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return R::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return R::failure(common::ErrorKind::TransientInfra, message);
  }

  Checkpoint checkpoint;
  checkpoint.session_id = session_id;
  checkpoint.turn_index = sqlite3_column_int64(stmt, 0);
  checkpoint.blob = column_blob(stmt, 1);
  const std::string checksum = column_text(stmt, 2);
  checkpoint.status = status_from_column(column_text(stmt, 3));
  checkpoint.reason = column_text(stmt, 4);
  checkpoint.updated_at = column_text(stmt, 5);
  sqlite3_finalize(stmt);

  if (common::sha256_hex(checkpoint.blob) != checksum) {
    return R::failure(common::ErrorKind::CorruptCheckpoint,
                      "checkpoint checksum mismatch for session " + session_id);
  }
  return R::success(std::move(checkpoint));
}

common::Result<bool> SqliteCheckpointStore::remove(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM checkpoints WHERE session_id = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(common::ErrorKind::TransientInfra, sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status SqliteCheckpointStore::mark_failed(const std::string &session_id,
                                                  const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  // A session that never saved a turn still gets a marker row with an empty blob.
  const char *sql =
      "INSERT INTO checkpoints(session_id, turn_index, blob, checksum, status, reason, updated_at) "
      "VALUES(?1, -1, ?2, ?3, 'failed', ?4, ?5) "
      "ON CONFLICT(session_id) DO UPDATE SET status = 'failed', reason = excluded.reason, "
      "updated_at = excluded.updated_at";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  const std::string empty;
  const std::string checksum = common::sha256_hex(empty);
  const std::string updated_at = common::now_rfc3339();
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, "", 0, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 3, checksum.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, reason.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, updated_at.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::TransientInfra, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<CheckpointSummary>> SqliteCheckpointStore::list_sessions() {
  using R = common::Result<std::vector<CheckpointSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT session_id, turn_index, status, reason, updated_at FROM checkpoints "
                    "ORDER BY updated_at DESC, session_id ASC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_));
  }
  std::vector<CheckpointSummary> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(CheckpointSummary{
        .session_id = column_text(stmt, 0),
        .turn_index = sqlite3_column_int64(stmt, 1),
        .status = status_from_column(column_text(stmt, 2)),
        .reason = column_text(stmt, 3),
        .updated_at = column_text(stmt, 4),
    });
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(common::ErrorKind::TransientInfra, sqlite3_errmsg(db_));
  }
  return R::success(std::move(out));
}

} // namespace warden::checkpoint
