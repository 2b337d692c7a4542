#pragma once

#include "talekeeper/persistence/sink.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace talekeeper::persistence {

/// Key-value store of session documents in a single SQLite table.
class SqliteSessionSink final : public SessionSink {
public:
  explicit SqliteSessionSink(std::filesystem::path db_path);
  ~SqliteSessionSink() override;

  SqliteSessionSink(const SqliteSessionSink &) = delete;
  SqliteSessionSink &operator=(const SqliteSessionSink &) = delete;

  [[nodiscard]] common::Status save(const sessions::Session &session) override;
  [[nodiscard]] common::Result<sessions::Session> load(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status ensure_open() const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace talekeeper::persistence
