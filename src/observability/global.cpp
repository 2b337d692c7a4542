#include "talekeeper/observability/global.hpp"

#include <mutex>

namespace talekeeper::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_dice_roll(const std::string &notation, const std::int64_t total, const bool seeded) {
  record_event(DiceRollEvent{.notation = notation, .total = total, .seeded = seeded});
}

void record_scene_started(const std::string &session_id, const std::string &scene_id,
                          const std::string &title) {
  record_event(SceneStartedEvent{.session_id = session_id, .scene_id = scene_id, .title = title});
}

void record_scene_ended(const std::string &session_id, const std::string &scene_id,
                        const bool has_summary) {
  record_event(SceneEndedEvent{
      .session_id = session_id, .scene_id = scene_id, .has_summary = has_summary});
}

void record_event_logged(const std::string &session_id, const std::string &scene_id,
                         const std::string &event_id, const std::string &type) {
  record_event(EventLoggedEvent{
      .session_id = session_id, .scene_id = scene_id, .event_id = event_id, .type = type});
}

void record_context_built(const std::string &session_id, const std::size_t sections,
                          const std::size_t consumed, const std::size_t budget) {
  record_event(ContextBuiltEvent{
      .session_id = session_id, .sections = sections, .consumed = consumed, .budget = budget});
  record_metric(ContextBudgetMetric{.consumed = consumed, .budget = budget});
}

void record_budget_warning(const std::string &session_id, const std::size_t consumed,
                           const std::size_t budget) {
  record_event(BudgetWarningEvent{.session_id = session_id, .consumed = consumed, .budget = budget});
}

void record_persist(const std::string &sink, const std::string &session_id, const bool success) {
  record_event(PersistEvent{.sink = sink, .session_id = session_id, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace talekeeper::observability
