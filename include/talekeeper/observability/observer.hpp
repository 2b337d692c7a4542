#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace talekeeper::observability {

struct DiceRollEvent {
  std::string notation;
  std::int64_t total = 0;
  bool seeded = false;
};

struct SceneStartedEvent {
  std::string session_id;
  std::string scene_id;
  std::string title;
};

struct SceneEndedEvent {
  std::string session_id;
  std::string scene_id;
  bool has_summary = false;
};

struct EventLoggedEvent {
  std::string session_id;
  std::string scene_id;
  std::string event_id;
  std::string type;
};

struct ContextBuiltEvent {
  std::string session_id;
  std::size_t sections = 0;
  std::size_t consumed = 0;
  std::size_t budget = 0;
};

/// Layer one alone exceeded the budget. Informational, not an error.
struct BudgetWarningEvent {
  std::string session_id;
  std::size_t consumed = 0;
  std::size_t budget = 0;
};

struct PersistEvent {
  std::string sink;
  std::string session_id;
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DiceRollEvent, SceneStartedEvent, SceneEndedEvent, EventLoggedEvent,
                 ContextBuiltEvent, BudgetWarningEvent, PersistEvent, ErrorEvent>;

struct ContextBudgetMetric {
  std::size_t consumed = 0;
  std::size_t budget = 0;
};

struct SessionSizeMetric {
  std::size_t scenes = 0;
  std::size_t events = 0;
};

using ObserverMetric = std::variant<ContextBudgetMetric, SessionSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace talekeeper::observability
