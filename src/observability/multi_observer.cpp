#include "talekeeper/observability/multi_observer.hpp"

namespace talekeeper::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (!observer) {
    return false;
  }
  children_.push_back(std::move(observer));
  return true;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_child([&event](IObserver &child) { child.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_child([&metric](IObserver &child) { child.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_child([](IObserver &child) { child.flush(); });
}

} // namespace talekeeper::observability
