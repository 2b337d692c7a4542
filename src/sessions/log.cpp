#include "talekeeper/sessions/log.hpp"

#include "talekeeper/observability/global.hpp"

#include <mutex>

namespace talekeeper::sessions {

SessionLog::SessionLog(Session session, std::shared_ptr<persistence::SessionSink> sink,
                       const bool auto_save)
    : id_(session.id()), session_(std::move(session)), sink_(std::move(sink)),
      auto_save_(auto_save) {}

common::Result<std::unique_ptr<SessionLog>>
SessionLog::create(std::shared_ptr<persistence::SessionSink> sink, const bool auto_save,
                   common::TimestampFn clock) {
  using R = common::Result<std::unique_ptr<SessionLog>>;
  auto log = std::make_unique<SessionLog>(Session::create(std::move(clock)), std::move(sink),
                                          auto_save);
  {
    std::unique_lock<std::shared_mutex> lock(log->mutex_);
    log->dirty_ = true;
    auto status = log->save_locked();
    if (!status.ok()) {
      return R::failure(status);
    }
  }
  return R::success(std::move(log));
}

common::Result<std::unique_ptr<SessionLog>>
SessionLog::open(std::shared_ptr<persistence::SessionSink> sink, const std::string &session_id,
                 const bool auto_save, common::TimestampFn clock) {
  using R = common::Result<std::unique_ptr<SessionLog>>;
  if (!sink) {
    return R::failure(common::ErrorCode::StorageFailure,
                      "no persistence backend configured; cannot open " + session_id);
  }
  auto loaded = sink->load(session_id);
  if (!loaded.ok()) {
    observability::record_error("sessions", loaded.error());
    return R::failure(loaded.status());
  }
  Session session = std::move(loaded.value());
  session.set_clock(std::move(clock));
  return R::success(std::make_unique<SessionLog>(std::move(session), std::move(sink), auto_save));
}

common::Status SessionLog::persist_locked() {
  observability::record_metric(observability::SessionSizeMetric{
      session_.scenes().size(), static_cast<std::size_t>(session_.next_event_seq() - 1)});
  if (!auto_save_ && sink_) {
    return common::Status::success();
  }
  return save_locked();
}

common::Status SessionLog::save_locked() {
  if (!sink_) {
    dirty_ = false;
    return common::Status::success();
  }
  auto status = sink_->save(session_);
  observability::record_persist(std::string(sink_->name()), id_, status.ok());
  if (!status.ok()) {
    dirty_ = true;
    observability::record_error("persistence", status.error());
    return common::Status::error(common::ErrorCode::StorageFailure, status.error());
  }
  dirty_ = false;
  return common::Status::success();
}

common::Result<std::string> SessionLog::start_scene(std::string title, std::string location,
                                                    const std::vector<std::string> &participants) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string scene_id = session_.start_scene(std::move(title), std::move(location), participants);
  dirty_ = true;
  auto status = persist_locked();
  if (!status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  return common::Result<std::string>::success(std::move(scene_id));
}

common::Status SessionLog::end_scene(std::optional<std::string> summary) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto ended = session_.end_scene(std::move(summary));
  if (!ended.ok()) {
    return ended;
  }
  dirty_ = true;
  return persist_locked();
}

common::Result<std::string> SessionLog::log_event(EventPayload payload,
                                                  std::optional<std::string> actor,
                                                  EventMetadata metadata) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto logged = session_.log_event(std::move(payload), std::move(actor), std::move(metadata));
  if (!logged.ok()) {
    return logged;
  }
  dirty_ = true;
  auto status = persist_locked();
  if (!status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  return logged;
}

common::Result<std::string> SessionLog::log_text_event(const EventType type, std::string text,
                                                       std::optional<std::string> actor,
                                                       EventMetadata metadata) {
  auto payload = make_text_payload(type, std::move(text));
  if (!payload.ok()) {
    return common::Result<std::string>::failure(payload.status());
  }
  return log_event(std::move(payload.value()), std::move(actor), std::move(metadata));
}

common::Result<std::string> SessionLog::log_roll(const dice::RollResult &result,
                                                 std::optional<std::string> actor,
                                                 EventMetadata metadata) {
  if (result.seed.has_value() && metadata.find("seed") == metadata.end()) {
    metadata["seed"] = std::to_string(*result.seed);
  }
  return log_event(make_dice_roll_payload(result), std::move(actor), std::move(metadata));
}

common::Status SessionLog::flush() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!dirty_) {
    return common::Status::success();
  }
  return save_locked();
}

bool SessionLog::dirty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return dirty_;
}

Session SessionLog::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return session_;
}

std::vector<Event> SessionLog::query_events(const EventFilter &filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return session_.query_events(filter).collect();
}

std::vector<Event> SessionLog::recent_events(const std::size_t count) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return session_.recent_events(count);
}

SessionStats SessionLog::stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return session_.stats();
}

} // namespace talekeeper::sessions
