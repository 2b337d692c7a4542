#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/dice/roller.hpp"
#include "talekeeper/persistence/sink.hpp"
#include "talekeeper/sessions/session.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace talekeeper::sessions {

/// A Session plus its persistence. Every mutation is saved to the sink when auto-save is on;
/// a failed save leaves the in-memory change in place, marks the log dirty and is retried on
/// the next mutation or flush().
class SessionLog {
public:
  SessionLog(Session session, std::shared_ptr<persistence::SessionSink> sink,
             bool auto_save = true);

  SessionLog(const SessionLog &) = delete;
  SessionLog &operator=(const SessionLog &) = delete;

  /// New session, saved once before it is returned.
  [[nodiscard]] static common::Result<std::unique_ptr<SessionLog>>
  create(std::shared_ptr<persistence::SessionSink> sink, bool auto_save = true,
         common::TimestampFn clock = common::system_clock_fn());

  [[nodiscard]] static common::Result<std::unique_ptr<SessionLog>>
  open(std::shared_ptr<persistence::SessionSink> sink, const std::string &session_id,
       bool auto_save = true, common::TimestampFn clock = common::system_clock_fn());

  [[nodiscard]] const std::string &id() const { return id_; }

  [[nodiscard]] common::Result<std::string>
  start_scene(std::string title, std::string location,
              const std::vector<std::string> &participants = {});
  [[nodiscard]] common::Status end_scene(std::optional<std::string> summary = std::nullopt);
  [[nodiscard]] common::Result<std::string> log_event(EventPayload payload,
                                                      std::optional<std::string> actor = std::nullopt,
                                                      EventMetadata metadata = {});
  [[nodiscard]] common::Result<std::string>
  log_text_event(EventType type, std::string text, std::optional<std::string> actor = std::nullopt,
                 EventMetadata metadata = {});
  [[nodiscard]] common::Result<std::string> log_roll(const dice::RollResult &result,
                                                     std::optional<std::string> actor = std::nullopt,
                                                     EventMetadata metadata = {});

  /// Saves if anything is unsaved.
  [[nodiscard]] common::Status flush();
  [[nodiscard]] bool dirty() const;

  /// Consistent copy for readers such as context assembly.
  [[nodiscard]] Session snapshot() const;
  [[nodiscard]] std::vector<Event> query_events(const EventFilter &filter = {}) const;
  [[nodiscard]] std::vector<Event> recent_events(std::size_t count) const;
  [[nodiscard]] SessionStats stats() const;

private:
  [[nodiscard]] common::Status persist_locked();
  [[nodiscard]] common::Status save_locked();

  std::string id_;
  Session session_;
  std::shared_ptr<persistence::SessionSink> sink_;
  bool auto_save_;
  bool dirty_ = false;
  mutable std::shared_mutex mutex_;
};

} // namespace talekeeper::sessions
