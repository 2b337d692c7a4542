#include "talekeeper/persistence/sink.hpp"

#include "talekeeper/common/fs.hpp"
#include "talekeeper/config/config.hpp"
#include "talekeeper/persistence/file_sink.hpp"
#include "talekeeper/persistence/sqlite_sink.hpp"

namespace talekeeper::persistence {

common::Result<std::unique_ptr<SessionSink>> make_session_sink(const config::Config &config) {
  using R = common::Result<std::unique_ptr<SessionSink>>;
  const std::string backend = common::to_lower(common::trim(config.persistence.backend));
  const auto data_dir = config::resolved_data_dir(config);

  if (backend == "file") {
    return R::success(std::make_unique<FileSessionSink>(data_dir / "sessions"));
  }
  if (backend == "sqlite") {
    auto sink = std::make_unique<SqliteSessionSink>(data_dir / "sessions.db");
    if (!sink->is_open()) {
      return R::failure(common::ErrorCode::StorageFailure,
                        "cannot open session database under " + data_dir.string());
    }
    return R::success(std::move(sink));
  }
  if (backend == "none") {
    return R::success(nullptr);
  }
  return R::failure(common::ErrorCode::ConfigError,
                    "unknown persistence.backend: " + config.persistence.backend);
}

} // namespace talekeeper::persistence
