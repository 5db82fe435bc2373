#pragma once

#include "warden/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace warden::checkpoint {

enum class CheckpointStatus { Active, Failed };

[[nodiscard]] std::string checkpoint_status_to_string(CheckpointStatus status);

struct Checkpoint {
  std::string session_id;
  /// -1 when a session failed before its first turn was saved.
  std::int64_t turn_index = -1;
  std::string blob;
  CheckpointStatus status = CheckpointStatus::Active;
  std::string reason;
  std::string updated_at;
};

struct CheckpointSummary {
  std::string session_id;
  std::int64_t turn_index = -1;
  CheckpointStatus status = CheckpointStatus::Active;
  std::string reason;
  std::string updated_at;
};

class ICheckpointStore {
public:
  virtual ~ICheckpointStore() = default;

  /// Replaces any earlier checkpoint of the session in one atomic write.
  [[nodiscard]] virtual common::Status save(const std::string &session_id,
                                            std::int64_t turn_index, const std::string &blob) = 0;
  [[nodiscard]] virtual common::Result<std::optional<Checkpoint>>
  load_latest(const std::string &session_id) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &session_id) = 0;
  [[nodiscard]] virtual common::Status mark_failed(const std::string &session_id,
                                                   const std::string &reason) = 0;
  [[nodiscard]] virtual common::Result<std::vector<CheckpointSummary>> list_sessions() = 0;
};

class SqliteCheckpointStore final : public ICheckpointStore {
public:
  explicit SqliteCheckpointStore(std::filesystem::path db_path);
  ~SqliteCheckpointStore() override;

  SqliteCheckpointStore(const SqliteCheckpointStore &) = delete;
  SqliteCheckpointStore &operator=(const SqliteCheckpointStore &) = delete;

  [[nodiscard]] common::Status save(const std::string &session_id, std::int64_t turn_index,
                                    const std::string &blob) override;
  [[nodiscard]] common::Result<std::optional<Checkpoint>>
  load_latest(const std::string &session_id) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &session_id) override;
  [[nodiscard]] common::Status mark_failed(const std::string &session_id,
                                           const std::string &reason) override;
  [[nodiscard]] common::Result<std::vector<CheckpointSummary>> list_sessions() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }
  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace warden::checkpoint
