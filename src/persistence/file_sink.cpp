#include "talekeeper/persistence/file_sink.hpp"

#include "talekeeper/common/fs.hpp"
#include "talekeeper/persistence/codec.hpp"

#include <algorithm>

namespace talekeeper::persistence {

FileSessionSink::FileSessionSink(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path FileSessionSink::session_path(const std::string &session_id) const {
  return dir_ / (common::sanitize_filename(session_id) + ".json");
}

common::Status FileSessionSink::save(const sessions::Session &session) {
  auto dir = common::ensure_dir(dir_);
  if (!dir.ok()) {
    return common::Status::error(common::ErrorCode::StorageFailure, dir.error());
  }
  return common::write_file_atomic(session_path(session.id()), encode_session(session));
}

common::Result<sessions::Session> FileSessionSink::load(const std::string &session_id) {
  auto content = common::read_file(session_path(session_id));
  if (!content.ok()) {
    if (content.code() == common::ErrorCode::NotFound) {
      return common::Result<sessions::Session>::failure(common::ErrorCode::NotFound,
                                                        "session not found: " + session_id);
    }
    return common::Result<sessions::Session>::failure(content.status());
  }
  return decode_session(content.value());
}

common::Result<std::vector<std::string>> FileSessionSink::list() {
  std::vector<std::string> ids;
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec)) {
    return common::Result<std::vector<std::string>>::success(std::move(ids));
  }

  std::filesystem::directory_iterator it(dir_, ec);
  if (ec) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::StorageFailure, "failed listing " + dir_.string() + ": " + ec.message());
  }
  for (const auto &entry : it) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
      ids.push_back(entry.path().stem().string());
    }
  }
  std::sort(ids.begin(), ids.end());
  return common::Result<std::vector<std::string>>::success(std::move(ids));
}

} // namespace talekeeper::persistence
