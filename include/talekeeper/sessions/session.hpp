#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/common/time.hpp"
#include "talekeeper/sessions/scene.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace talekeeper::sessions {

/// Inclusive on both ends; timestamps compare as RFC 3339 strings.
struct TimeRange {
  std::optional<std::string> from;
  std::optional<std::string> to;
};

struct EventFilter {
  std::optional<EventType> type;
  std::optional<std::string> actor;
  std::optional<std::string> scene_id;
  TimeRange time_range;
};

/// Lazy view over a session's events in append order. Restartable: each begin() starts a
/// fresh pass. Invalidated by any mutation of the session it was taken from.
class EventQuery {
public:
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Event;
    using difference_type = std::ptrdiff_t;
    using pointer = const Event *;
    using reference = const Event &;

    Iterator() = default;

    reference operator*() const;
    pointer operator->() const { return &**this; }
    Iterator &operator++();
    Iterator operator++(int);
    bool operator==(const Iterator &other) const {
      return scene_ == other.scene_ && event_ == other.event_;
    }

  private:
    friend class EventQuery;
    Iterator(const EventQuery *query, std::size_t scene, std::size_t event);
    void skip_unmatched();

    const EventQuery *query_ = nullptr;
    std::size_t scene_ = 0;
    std::size_t event_ = 0;
  };

  EventQuery(const std::vector<Scene> &scenes, EventFilter filter);

  [[nodiscard]] Iterator begin() const;
  [[nodiscard]] Iterator end() const;

  [[nodiscard]] std::vector<Event> collect() const;
  [[nodiscard]] std::size_t count() const;

private:
  [[nodiscard]] bool scene_matches(const Scene &scene) const;
  [[nodiscard]] bool event_matches(const Event &event) const;

  const std::vector<Scene> *scenes_;
  EventFilter filter_;
};

struct SessionStats {
  std::size_t scene_count = 0;
  std::size_t event_count = 0;
  std::optional<std::string> active_scene_id;
  std::map<std::string, std::size_t> events_by_type;
  std::optional<std::string> first_event_at;
  std::optional<std::string> last_event_at;
};

/// One play-through: scenes in creation order, at most one of them active.
class Session {
public:
  Session(std::string id, std::string created_at,
          common::TimestampFn clock = common::system_clock_fn());

  /// Fresh session with a generated id ("session_20261018_120000_a1b2").
  [[nodiscard]] static Session create(common::TimestampFn clock = common::system_clock_fn());

  /// Rebuilds a decoded session, checking the structural invariants.
  [[nodiscard]] static common::Result<Session>
  restore(std::string id, std::string created_at, std::vector<Scene> scenes,
          std::uint64_t next_event_seq, common::TimestampFn clock = common::system_clock_fn());

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &created_at() const { return created_at_; }
  [[nodiscard]] const std::vector<Scene> &scenes() const { return scenes_; }
  [[nodiscard]] std::optional<std::size_t> active_scene_index() const { return active_index_; }
  [[nodiscard]] const Scene *active_scene() const;
  [[nodiscard]] const Scene *find_scene(const std::string &scene_id) const;
  [[nodiscard]] std::uint64_t next_event_seq() const { return next_event_seq_; }

  /// Ends the active scene (without a summary) and opens a new one. Returns its id.
  std::string start_scene(std::string title, std::string location,
                          const std::vector<std::string> &participants = {});
  [[nodiscard]] common::Status end_scene(std::optional<std::string> summary = std::nullopt);
  [[nodiscard]] common::Result<std::string> log_event(EventPayload payload,
                                                      std::optional<std::string> actor = std::nullopt,
                                                      EventMetadata metadata = {});

  [[nodiscard]] EventQuery query_events(EventFilter filter = {}) const;
  /// The last `count` events across all scenes, oldest first.
  [[nodiscard]] std::vector<Event> recent_events(std::size_t count) const;
  [[nodiscard]] SessionStats stats() const;

  void set_clock(common::TimestampFn clock);

  /// Compares recorded state; the clock is not part of a session's identity.
  bool operator==(const Session &other) const;

private:
  std::string id_;
  std::string created_at_;
  std::vector<Scene> scenes_;
  std::optional<std::size_t> active_index_;
  std::uint64_t next_event_seq_ = 1;
  common::TimestampFn clock_;
};

[[nodiscard]] std::string make_session_id(const std::string &created_at);

} // namespace talekeeper::sessions
