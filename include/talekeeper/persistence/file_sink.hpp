#pragma once

#include "talekeeper/persistence/sink.hpp"

#include <filesystem>

namespace talekeeper::persistence {

/// One JSON document per session: <dir>/<sanitized id>.json, replaced atomically on save.
class FileSessionSink final : public SessionSink {
public:
  explicit FileSessionSink(std::filesystem::path dir);

  [[nodiscard]] common::Status save(const sessions::Session &session) override;
  [[nodiscard]] common::Result<sessions::Session> load(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

  [[nodiscard]] std::filesystem::path session_path(const std::string &session_id) const;

private:
  std::filesystem::path dir_;
};

} // namespace talekeeper::persistence
