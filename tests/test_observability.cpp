#include "test_framework.hpp"

#include "talekeeper/config/schema.hpp"
#include "talekeeper/observability/factory.hpp"
#include "talekeeper/observability/global.hpp"
#include "talekeeper/observability/log_observer.hpp"
#include "talekeeper/observability/multi_observer.hpp"
#include "talekeeper/observability/noop_observer.hpp"
#include "talekeeper/sessions/log.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public talekeeper::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const talekeeper::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const talekeeper::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_observability_tests(std::vector<talekeeper::tests::TestCase> &tests) {
  using talekeeper::tests::require;
  namespace ob = talekeeper::observability;
  namespace tt = talekeeper::testing;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_dice_roll("1d20", 12, false);
                     ob::record_metric(ob::SessionSizeMetric{.scenes = 1, .events = 2});

                     // Reset to prevent dangling references during static destruction
                     ob::set_global_observer(nullptr);
                     ob::record_error("test", "dropped without an observer");
                   }});

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::DiceRollEvent{"4d6kh3", 14, true});
                     observer.record_event(ob::SceneStartedEvent{"s1", "scene_1", "Gate"});
                     observer.record_event(ob::BudgetWarningEvent{"s1", 900, 500});
                     observer.record_event(ob::PersistEvent{"file", "s1", false});
                     observer.record_event(ob::ErrorEvent{"persistence", "disk full"});
                     observer.record_metric(ob::ContextBudgetMetric{120, 500});
                     observer.flush();

                     const std::string text = out.str();
                     require(contains(text, "[DEBUG] dice.roll notation=4d6kh3 total=14 seeded=true\n"),
                             "dice line: " + text);
                     require(contains(text, "[INFO] scene.start session=s1 scene=scene_1 title=Gate\n"),
                             "scene line");
                     require(contains(text,
                                      "[WARN] context.over_budget session=s1 current_scene=900 "
                                      "budget=500\n"),
                             "budget warning line");
                     require(contains(text, "[WARN] persist sink=file session=s1 ok=false\n"),
                             "failed persist is a warning");
                     require(contains(text, "[ERROR] persistence: disk full\n"), "error line");
                     require(contains(text, "metric.context_budget consumed=120 budget=500"),
                             "metric line");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     require(multi->add(std::make_unique<CountingObserver>(&one)), "first child");
                     require(multi->add(std::make_unique<CountingObserver>(&two)), "second child");
                     require(!multi->add(nullptr), "null child refused");
                     require(multi->size() == 2, "null children are not attached");

                     multi->record_event(ob::ErrorEvent{"x", "y"});
                     multi->record_metric(ob::SessionSizeMetric{});
                     multi->flush();
                     require(one.events == 1 && two.events == 1, "events forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metrics forwarded");
                     require(one.flushes == 1 && two.flushes == 1, "flush forwarded");
                   }});

  tests.push_back({"observability_factory_by_backend", [] {
                     talekeeper::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = " LOG ";
                     require(ob::create_observer(config)->name() == "log", "log");
                     config.observability.backend = "statsd";
                     require(ob::create_observer(config)->name() == "noop", "unknown falls back");
                     config.observability.backend = "log, noop";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma list");
                     require(static_cast<ob::MultiObserver *>(multi.get())->size() == 2,
                             "two children");
                   }});

  tests.push_back({"observability_session_log_reports_persistence", [] {
                     tt::ScopedRecordingObserver observer;
                     auto sink = std::make_shared<tt::MemorySessionSink>();
                     auto created =
                         talekeeper::sessions::SessionLog::create(sink, true, tt::stepping_clock());
                     require(created.ok(), "create");
                     auto &log = *created.value();
                     require(log.start_scene("Cellar", "Inn").ok(), "start scene");
                     sink->set_fail_saves(true);
                     (void)log.end_scene(std::string("Rats everywhere."));

                     const auto &signals = observer.signals();
                     require(signals.count<ob::SceneStartedEvent>() == 1, "scene start recorded");
                     require(signals.count<ob::SceneEndedEvent>() == 1, "scene end recorded");
                     require(signals.count<ob::PersistEvent>() == 3, "one persist per save attempt");
                     require(signals.count<ob::ErrorEvent>() == 1, "failed save reported");
                     require(!signals.metrics.empty(), "session size metrics recorded");
                   }});
}
