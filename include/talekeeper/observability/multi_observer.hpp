#pragma once

#include "talekeeper/observability/observer.hpp"

#include <memory>
#include <vector>

namespace talekeeper::observability {

/// Fans every event and metric out to each attached observer, in attach order.
class MultiObserver final : public IObserver {
public:
  /// False when `observer` is null; nothing is attached then.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return children_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each_child(Fn &&fn) {
    for (auto &child : children_) {
      fn(*child);
    }
  }

  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace talekeeper::observability
