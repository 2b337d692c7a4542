#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/common/time.hpp"
#include "talekeeper/sessions/session.hpp"

#include <string>

namespace talekeeper::persistence {

constexpr const char *kSessionFormat = "talekeeper.session";
constexpr int kSessionFormatVersion = 1;

[[nodiscard]] std::string encode_session(const sessions::Session &session);

/// Fails with ErrorCode::StorageFailure naming the first structural problem found.
[[nodiscard]] common::Result<sessions::Session>
decode_session(const std::string &document, common::TimestampFn clock = common::system_clock_fn());

[[nodiscard]] std::string encode_event(const sessions::Event &event);
[[nodiscard]] common::Result<sessions::Event> decode_event(const std::string &json);

} // namespace talekeeper::persistence
