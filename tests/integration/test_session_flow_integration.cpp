#include "../test_framework.hpp"

#include "talekeeper/context/assembler.hpp"
#include "talekeeper/dice/random.hpp"
#include "talekeeper/dice/roller.hpp"
#include "talekeeper/generation/turn.hpp"
#include "talekeeper/persistence/file_sink.hpp"
#include "talekeeper/persistence/sqlite_sink.hpp"
#include "talekeeper/sessions/log.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

void register_session_flow_integration_tests(std::vector<talekeeper::tests::TestCase> &tests) {
  using talekeeper::tests::require;
  namespace cx = talekeeper::context;
  namespace dc = talekeeper::dice;
  namespace gn = talekeeper::generation;
  namespace ps = talekeeper::persistence;
  namespace ss = talekeeper::sessions;
  namespace tt = talekeeper::testing;

  tests.push_back({"integration_campaign_survives_reopen", [] {
                     tt::TempWorkspace workspace;
                     auto sink = std::make_shared<ps::FileSessionSink>(workspace.path() / "sessions");
                     std::string session_id;
                     {
                       auto created = ss::SessionLog::create(sink, true, tt::stepping_clock());
                       require(created.ok(), "create");
                       auto &log = *created.value();
                       session_id = log.id();

                       require(log.start_scene("Ambush", "Forest road", {"Aria", "Bram"}).ok(),
                               "first scene");
                       require(log.log_text_event(ss::EventType::Narration,
                                                  "Arrows hiss from the trees.", "dm")
                                   .ok(),
                               "narration");
                       dc::SeededRandomSource rng(42);
                       auto initiative = dc::roll_notation("2#d20+2", rng);
                       require(initiative.ok() && initiative.value().size() == 2, "two rolls");
                       for (const auto &result : initiative.value()) {
                         require(log.log_roll(result, "Aria").ok(), "roll logged");
                       }
                       require(log.end_scene(std::string("The bandits fled.")).ok(), "end ambush");

                       require(log.start_scene("Camp", "Clearing").ok(), "second scene");
                       tt::MockGenerator generator;
                       generator.set_response("The fire crackles as night falls.");
                       cx::ContextAssembler assembler;
                       auto turn = gn::run_turn(log, assembler, generator, {2000},
                                                "I keep first watch.", "Bram");
                       require(turn.ok(), turn.ok() ? "" : turn.error());
                       require(!log.dirty(), "auto-save kept the sink current");
                     }

                     auto reopened = ss::SessionLog::open(sink, session_id, true, tt::stepping_clock());
                     require(reopened.ok(), reopened.ok() ? "" : reopened.error());
                     auto &log = *reopened.value();
                     const auto stats = log.stats();
                     require(stats.scene_count == 2, "two scenes");
                     require(stats.event_count == 5, "narration, two rolls, action, reply");
                     require(stats.active_scene_id == std::optional<std::string>("scene_2"),
                             "camp still active");

                     ss::EventFilter rolls;
                     rolls.type = ss::EventType::DiceRoll;
                     rolls.actor = std::string("Aria");
                     require(log.query_events(rolls).size() == 2, "rolls queryable after reopen");

                     auto next = log.log_text_event(ss::EventType::System, "Long rest.");
                     require(next.ok() && next.value() == "evt_6", "sequence continues");

                     const cx::ContextAssembler assembler;
                     const auto package = assembler.build(log.snapshot(), {2000});
                     require(package.sections.size() == 2, "previous scene plus current");
                     require(package.sections.front().scene_id == "scene_1", "ambush included");
                     require(package.sections.back().layer == cx::SectionLayer::CurrentScene,
                             "camp last");
                     const auto rendered = cx::render_context(package);
                     require(rendered.find("[Bram] I keep first watch.") != std::string::npos,
                             "player action in context");
                     require(rendered.find("[dm] The fire crackles as night falls.") !=
                                 std::string::npos,
                             "narration in context");
                   }});

  tests.push_back({"integration_sqlite_backed_session", [] {
                     tt::TempWorkspace workspace;
                     auto sink =
                         std::make_shared<ps::SqliteSessionSink>(workspace.path() / "campaign.db");
                     require(sink->is_open(), "database opened");
                     auto created = ss::SessionLog::create(sink, false, tt::stepping_clock());
                     require(created.ok(), "create");
                     auto &log = *created.value();
                     require(log.start_scene("Duel", "Arena").ok(), "scene");
                     require(log.log_text_event(ss::EventType::NpcDialogue, "En garde!", "Rival").ok(),
                             "dialogue");
                     require(log.dirty(), "manual save pending");
                     auto before = sink->load(log.id());
                     require(before.ok() && before.value().stats().event_count == 0,
                             "only the empty session is stored before flush");
                     require(log.flush().ok(), "flush");
                     require(!log.dirty(), "clean after flush");

                     auto loaded = sink->load(log.id());
                     require(loaded.ok(), "stored after flush");
                     require(loaded.value() == log.snapshot(), "stored document matches");
                   }});

  tests.push_back({"integration_concurrent_logging", [] {
                     auto sink = std::make_shared<tt::MemorySessionSink>();
                     auto created = ss::SessionLog::create(sink, true, tt::stepping_clock());
                     require(created.ok(), "create");
                     auto &log = *created.value();
                     require(log.start_scene("Melee", "Courtyard").ok(), "scene");

                     constexpr int kThreads = 4;
                     constexpr int kPerThread = 25;
                     std::vector<std::thread> workers;
                     for (int t = 0; t < kThreads; ++t) {
                       workers.emplace_back([&log, t] {
                         for (int i = 0; i < kPerThread; ++i) {
                           (void)log.log_text_event(ss::EventType::NpcAction,
                                                    "swing " + std::to_string(i),
                                                    "fighter_" + std::to_string(t));
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }

                     const auto events = log.query_events();
                     require(events.size() == static_cast<std::size_t>(kThreads * kPerThread), "every event logged");
                     std::set<std::string> ids;
                     for (const auto &event : events) {
                       ids.insert(event.id);
                     }
                     require(ids.size() == events.size(), "event ids are unique");
                     auto stored = sink->load(log.id());
                     require(stored.ok() && stored.value().stats().event_count == events.size(),
                             "last save holds every event");
                   }});
}
