#include "talekeeper/sessions/session.hpp"

#include "talekeeper/observability/global.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace talekeeper::sessions {

namespace {

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed while generating a session id");
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

} // namespace

std::string make_session_id(const std::string &created_at) {
  return "session_" + common::compact_timestamp(created_at) + "_" + random_hex(2);
}

// EventQuery

EventQuery::EventQuery(const std::vector<Scene> &scenes, EventFilter filter)
    : scenes_(&scenes), filter_(std::move(filter)) {}

bool EventQuery::scene_matches(const Scene &scene) const {
  return !filter_.scene_id.has_value() || scene.id == *filter_.scene_id;
}

bool EventQuery::event_matches(const Event &event) const {
  if (filter_.type.has_value() && event.type() != *filter_.type) {
    return false;
  }
  if (filter_.actor.has_value() && event.actor != filter_.actor) {
    return false;
  }
  if (filter_.time_range.from.has_value() && event.timestamp < *filter_.time_range.from) {
    return false;
  }
  if (filter_.time_range.to.has_value() && event.timestamp > *filter_.time_range.to) {
    return false;
  }
  return true;
}

EventQuery::Iterator EventQuery::begin() const {
  Iterator it(this, 0, 0);
  it.skip_unmatched();
  return it;
}

EventQuery::Iterator EventQuery::end() const { return Iterator(this, scenes_->size(), 0); }

std::vector<Event> EventQuery::collect() const { return std::vector<Event>(begin(), end()); }

std::size_t EventQuery::count() const {
  return static_cast<std::size_t>(std::distance(begin(), end()));
}

EventQuery::Iterator::Iterator(const EventQuery *query, const std::size_t scene,
                               const std::size_t event)
    : query_(query), scene_(scene), event_(event) {}

void EventQuery::Iterator::skip_unmatched() {
  const auto &scenes = *query_->scenes_;
  while (scene_ < scenes.size()) {
    const Scene &scene = scenes[scene_];
    if (query_->scene_matches(scene)) {
      while (event_ < scene.events.size()) {
        if (query_->event_matches(scene.events[event_])) {
          return;
        }
        ++event_;
      }
    }
    ++scene_;
    event_ = 0;
  }
}

EventQuery::Iterator::reference EventQuery::Iterator::operator*() const {
  return (*query_->scenes_)[scene_].events[event_];
}

EventQuery::Iterator &EventQuery::Iterator::operator++() {
  ++event_;
  skip_unmatched();
  return *this;
}

EventQuery::Iterator EventQuery::Iterator::operator++(int) {
  Iterator copy = *this;
  ++*this;
  return copy;
}

// Session

Session::Session(std::string id, std::string created_at, common::TimestampFn clock)
    : id_(std::move(id)), created_at_(std::move(created_at)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::system_clock_fn();
  }
}

Session Session::create(common::TimestampFn clock) {
  if (!clock) {
    clock = common::system_clock_fn();
  }
  std::string created_at = clock();
  std::string id = make_session_id(created_at);
  return Session(std::move(id), std::move(created_at), std::move(clock));
}

common::Result<Session> Session::restore(std::string id, std::string created_at,
                                         std::vector<Scene> scenes,
                                         const std::uint64_t next_event_seq,
                                         common::TimestampFn clock) {
  using R = common::Result<Session>;
  if (id.empty()) {
    return R::failure(common::ErrorCode::StorageFailure, "session id is empty");
  }

  std::set<std::string> scene_ids;
  std::set<std::string> event_ids;
  std::optional<std::size_t> active_index;
  std::size_t event_total = 0;
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    const Scene &scene = scenes[i];
    if (scene.id.empty()) {
      return R::failure(common::ErrorCode::StorageFailure, "scene without an id");
    }
    if (!scene_ids.insert(scene.id).second) {
      return R::failure(common::ErrorCode::StorageFailure, "duplicate scene id: " + scene.id);
    }
    if (scene.active) {
      if (active_index.has_value()) {
        return R::failure(common::ErrorCode::StorageFailure,
                          "more than one active scene: " + scenes[*active_index].id + ", " +
                              scene.id);
      }
      if (scene.ended_at.has_value()) {
        return R::failure(common::ErrorCode::StorageFailure,
                          "active scene has an end time: " + scene.id);
      }
      active_index = i;
    }
    for (const auto &event : scene.events) {
      if (!event_ids.insert(event.id).second) {
        return R::failure(common::ErrorCode::StorageFailure, "duplicate event id: " + event.id);
      }
    }
    event_total += scene.events.size();
  }
  if (next_event_seq <= event_total) {
    return R::failure(common::ErrorCode::StorageFailure,
                      "next_event_seq " + std::to_string(next_event_seq) +
                          " does not follow the " + std::to_string(event_total) +
                          " recorded events");
  }

  Session session(std::move(id), std::move(created_at), std::move(clock));
  session.scenes_ = std::move(scenes);
  session.active_index_ = active_index;
  session.next_event_seq_ = next_event_seq;
  return R::success(std::move(session));
}

const Scene *Session::active_scene() const {
  if (!active_index_.has_value()) {
    return nullptr;
  }
  return &scenes_[*active_index_];
}

const Scene *Session::find_scene(const std::string &scene_id) const {
  const auto it = std::find_if(scenes_.begin(), scenes_.end(),
                               [&](const Scene &scene) { return scene.id == scene_id; });
  return it == scenes_.end() ? nullptr : &*it;
}

std::string Session::start_scene(std::string title, std::string location,
                                 const std::vector<std::string> &participants) {
  if (active_index_.has_value()) {
    (void)end_scene(std::nullopt);
  }

  Scene scene;
  scene.id = "scene_" + std::to_string(scenes_.size() + 1);
  scene.title = std::move(title);
  scene.location = std::move(location);
  for (const auto &participant : participants) {
    if (!participant.empty()) {
      scene.participants.insert(participant);
    }
  }
  scene.started_at = clock_();
  scene.active = true;

  scenes_.push_back(std::move(scene));
  active_index_ = scenes_.size() - 1;

  const Scene &started = scenes_.back();
  observability::record_scene_started(id_, started.id, started.title);
  return started.id;
}

common::Status Session::end_scene(std::optional<std::string> summary) {
  if (!active_index_.has_value()) {
    return common::Status::error(common::ErrorCode::NoActiveScene, "no active scene to end");
  }
  Scene &scene = scenes_[*active_index_];
  scene.ended_at = clock_();
  scene.active = false;
  scene.summary = std::move(summary);
  active_index_.reset();

  observability::record_scene_ended(id_, scene.id, scene.summary.has_value());
  return common::Status::success();
}

common::Result<std::string> Session::log_event(EventPayload payload,
                                               std::optional<std::string> actor,
                                               EventMetadata metadata) {
  if (!active_index_.has_value()) {
    return common::Result<std::string>::failure(common::ErrorCode::NoActiveScene,
                                                "no active scene; start a scene first");
  }
  Scene &scene = scenes_[*active_index_];

  Event event;
  event.id = "evt_" + std::to_string(next_event_seq_++);
  event.timestamp = clock_();
  if (actor.has_value() && actor->empty()) {
    actor.reset();
  }
  event.actor = std::move(actor);
  event.payload = std::move(payload);
  event.metadata = std::move(metadata);

  if (event.actor.has_value()) {
    scene.participants.insert(*event.actor);
  }
  scene.events.push_back(std::move(event));

  const Event &logged = scene.events.back();
  observability::record_event_logged(id_, scene.id, logged.id,
                                     event_type_to_string(logged.type()));
  return common::Result<std::string>::success(logged.id);
}

EventQuery Session::query_events(EventFilter filter) const {
  return EventQuery(scenes_, std::move(filter));
}

std::vector<Event> Session::recent_events(const std::size_t count) const {
  std::vector<Event> out;
  for (auto scene = scenes_.rbegin(); scene != scenes_.rend() && out.size() < count; ++scene) {
    for (auto event = scene->events.rbegin();
         event != scene->events.rend() && out.size() < count; ++event) {
      out.push_back(*event);
    }
  }
  std::reverse(out.begin(), out.end());
  return out;
}

SessionStats Session::stats() const {
  SessionStats stats;
  stats.scene_count = scenes_.size();
  if (const Scene *active = active_scene()) {
    stats.active_scene_id = active->id;
  }
  for (const auto &scene : scenes_) {
    for (const auto &event : scene.events) {
      ++stats.event_count;
      ++stats.events_by_type[event_type_to_string(event.type())];
      if (!stats.first_event_at.has_value()) {
        stats.first_event_at = event.timestamp;
      }
      stats.last_event_at = event.timestamp;
    }
  }
  return stats;
}

void Session::set_clock(common::TimestampFn clock) {
  clock_ = clock ? std::move(clock) : common::system_clock_fn();
}

bool Session::operator==(const Session &other) const {
  return id_ == other.id_ && created_at_ == other.created_at_ && scenes_ == other.scenes_ &&
         active_index_ == other.active_index_ && next_event_seq_ == other.next_event_seq_;
}

} // namespace talekeeper::sessions
