#pragma once

#include "talekeeper/observability/observer.hpp"

#include <memory>

namespace talekeeper::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_dice_roll(const std::string &notation, std::int64_t total, bool seeded);
void record_scene_started(const std::string &session_id, const std::string &scene_id,
                          const std::string &title);
void record_scene_ended(const std::string &session_id, const std::string &scene_id,
                        bool has_summary);
void record_event_logged(const std::string &session_id, const std::string &scene_id,
                         const std::string &event_id, const std::string &type);
void record_context_built(const std::string &session_id, std::size_t sections,
                          std::size_t consumed, std::size_t budget);
void record_budget_warning(const std::string &session_id, std::size_t consumed,
                           std::size_t budget);
void record_persist(const std::string &sink, const std::string &session_id, bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace talekeeper::observability
