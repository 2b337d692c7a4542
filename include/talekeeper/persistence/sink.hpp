#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/config/schema.hpp"
#include "talekeeper/sessions/session.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace talekeeper::persistence {

/// Durable home for whole session documents, keyed by session id.
class SessionSink {
public:
  virtual ~SessionSink() = default;

  [[nodiscard]] virtual common::Status save(const sessions::Session &session) = 0;
  /// NotFound when no session with this id was saved.
  [[nodiscard]] virtual common::Result<sessions::Session> load(const std::string &session_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>> list() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// "file", "sqlite" or "none" (a null sink: nothing is persisted).
[[nodiscard]] common::Result<std::unique_ptr<SessionSink>>
make_session_sink(const config::Config &config);

} // namespace talekeeper::persistence
