#include "talekeeper/persistence/sqlite_sink.hpp"

#include "talekeeper/common/time.hpp"
#include "talekeeper/persistence/codec.hpp"

namespace talekeeper::persistence {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::StorageFailure, msg);
  }
  return common::Status::success();
}

} // namespace

SqliteSessionSink::SqliteSessionSink(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  auto status = init_schema();
  if (!status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteSessionSink::~SqliteSessionSink() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteSessionSink::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  document TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Status SqliteSessionSink::ensure_open() const {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::StorageFailure,
                                 "cannot open " + db_path_.string() + ": " + open_error_);
  }
  return common::Status::success();
}

common::Status SqliteSessionSink::save(const sessions::Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto open = ensure_open();
  if (!open.ok()) {
    return open;
  }

  const std::string document = encode_session(session);
  const std::string now = common::now_rfc3339();

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO sessions(id, document, updated_at) VALUES(?1, ?2, ?3) "
                    "ON CONFLICT(id) DO UPDATE SET document = excluded.document, "
                    "updated_at = excluded.updated_at";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, session.id().c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, document.c_str(), static_cast<int>(document.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<sessions::Session> SqliteSessionSink::load(const std::string &session_id) {
  using R = common::Result<sessions::Session>;
  std::string document;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto open = ensure_open();
    if (!open.ok()) {
      return R::failure(open);
    }

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT document FROM sessions WHERE id = ?1";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return R::failure(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
      const int bytes = sqlite3_column_bytes(stmt, 0);
      if (text != nullptr) {
        document.assign(text, static_cast<std::size_t>(bytes));
      }
    }
    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
      return R::failure(common::ErrorCode::NotFound, "session not found: " + session_id);
    }
    if (rc != SQLITE_ROW) {
      return R::failure(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
    }
  }
  return decode_session(document);
}

common::Result<std::vector<std::string>> SqliteSessionSink::list() {
  using R = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto open = ensure_open();
  if (!open.ok()) {
    return R::failure(open);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT id FROM sessions ORDER BY id", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return R::failure(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }

  std::vector<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    ids.emplace_back(text == nullptr ? "" : text);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }
  return R::success(std::move(ids));
}

} // namespace talekeeper::persistence
