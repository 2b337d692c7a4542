#include "talekeeper/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace talekeeper::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DiceRollEvent>) {
          log_line("DEBUG", "dice.roll notation=" + evt.notation +
                                " total=" + std::to_string(evt.total) +
                                " seeded=" + (evt.seeded ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, SceneStartedEvent>) {
          log_line("INFO", "scene.start session=" + evt.session_id + " scene=" + evt.scene_id +
                               " title=" + evt.title);
        } else if constexpr (std::is_same_v<T, SceneEndedEvent>) {
          log_line("INFO", "scene.end session=" + evt.session_id + " scene=" + evt.scene_id +
                               " summary=" + (evt.has_summary ? std::string("yes") : std::string("no")));
        } else if constexpr (std::is_same_v<T, EventLoggedEvent>) {
          log_line("DEBUG", "event.append session=" + evt.session_id + " scene=" + evt.scene_id +
                                " id=" + evt.event_id + " type=" + evt.type);
        } else if constexpr (std::is_same_v<T, ContextBuiltEvent>) {
          log_line("DEBUG", "context.build session=" + evt.session_id +
                                " sections=" + std::to_string(evt.sections) +
                                " consumed=" + std::to_string(evt.consumed) +
                                " budget=" + std::to_string(evt.budget));
        } else if constexpr (std::is_same_v<T, BudgetWarningEvent>) {
          log_line("WARN", "context.over_budget session=" + evt.session_id +
                               " current_scene=" + std::to_string(evt.consumed) +
                               " budget=" + std::to_string(evt.budget));
        } else if constexpr (std::is_same_v<T, PersistEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "persist sink=" + evt.sink + " session=" + evt.session_id +
                       " ok=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ContextBudgetMetric>) {
          log_line("DEBUG", "metric.context_budget consumed=" + std::to_string(m.consumed) +
                                " budget=" + std::to_string(m.budget));
        } else if constexpr (std::is_same_v<T, SessionSizeMetric>) {
          log_line("DEBUG", "metric.session_size scenes=" + std::to_string(m.scenes) +
                                " events=" + std::to_string(m.events));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace talekeeper::observability
