#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> lines_of(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

// Quiet observer and a file backend under the isolated HOME.
void write_cli_config(const talekeeper::testing::IsolatedConfigEnv &env) {
  std::filesystem::create_directories(env.config_file().parent_path());
  std::ofstream out(env.config_file());
  out << "data_dir = \"" << (env.home() / "campaigns").string() << "\"\n"
      << "[persistence]\nbackend = \"file\"\n"
      << "[observability]\nbackend = \"none\"\n";
}

std::string first_line(const std::string &text) {
  const auto lines = lines_of(text);
  return lines.empty() ? std::string() : lines.front();
}

} // namespace

void register_cli_tests(std::vector<talekeeper::tests::TestCase> &tests) {
  using talekeeper::tests::require;
  namespace tt = talekeeper::testing;

  tests.push_back({"cli_help_version_and_unknown", [] {
                     const tt::IsolatedConfigEnv env;
                     const auto none = tt::run_cli_captured({});
                     require(none.code == 0 && contains(none.out, "usage: talekeeper"),
                             "no arguments prints help");
                     const auto help = tt::run_cli_captured({"help"});
                     require(help.code == 0 && contains(help.out, "scene start"), "help");
                     const auto version = tt::run_cli_captured({"--version"});
                     require(version.code == 0 && contains(version.out, "talekeeper "), "version");
                     const auto unknown = tt::run_cli_captured({"juggle"});
                     require(unknown.code == 1, "unknown command fails");
                     require(contains(unknown.err, "unknown command: juggle"), "error names it");
                   }});

  tests.push_back({"cli_roll_seeded_is_reproducible", [] {
                     const tt::IsolatedConfigEnv env;
                     write_cli_config(env);
                     const auto first = tt::run_cli_captured({"roll", "4d6kh3", "--seed", "7"});
                     require(first.code == 0, first.err);
                     require(contains(first.out, "4d6kh3:"), "describe line: " + first.out);
                     require(contains(first.out, "seed: 7\n"), "seed echoed");
                     const auto second = tt::run_cli_captured({"roll", "4d6kh3", "-s", "7"});
                     require(second.out == first.out, "same seed, same output");

                     const auto repeated = tt::run_cli_captured({"roll", "3#d6", "--seed", "1"});
                     require(repeated.code == 0, repeated.err);
                     require(lines_of(repeated.out).size() == 4, "three rolls and the seed");
                   }});

  tests.push_back({"cli_roll_rejects_bad_input", [] {
                     const tt::IsolatedConfigEnv env;
                     write_cli_config(env);
                     const auto bad = tt::run_cli_captured({"roll", "2d6+x"});
                     require(bad.code == 1, "invalid notation fails");
                     require(!bad.err.empty(), "error reported on stderr");
                     const auto seed = tt::run_cli_captured({"roll", "d20", "--seed", "abc"});
                     require(seed.code == 1 && contains(seed.err, "invalid seed"), "bad seed");
                     const auto empty = tt::run_cli_captured({"roll"});
                     require(empty.code == 1, "notation required");
                   }});

  tests.push_back({"cli_session_workflow", [] {
                     const tt::IsolatedConfigEnv env;
                     write_cli_config(env);

                     const auto created = tt::run_cli_captured({"session", "new"});
                     require(created.code == 0, created.err);
                     const auto id = first_line(created.out);
                     require(id.rfind("session_", 0) == 0, "session id printed: " + id);

                     const auto no_scene = tt::run_cli_captured(
                         {"log", id, "--type", "narration", "--text", "Too early."});
                     require(no_scene.code == 1, "logging needs an active scene");

                     const auto scene = tt::run_cli_captured({"scene", "start", id, "--title", "Gate",
                                                              "--location", "North wall",
                                                              "--participant", "Aria"});
                     require(scene.code == 0 && first_line(scene.out) == "scene_1", scene.err);

                     const auto logged = tt::run_cli_captured(
                         {"log", id, "--type", "narration", "--text", "Rain falls.", "--actor", "dm",
                          "--meta", "mood=grim"});
                     require(logged.code == 0, logged.err);
                     require(first_line(logged.out) == "evt_1", "event id printed");

                     const auto bad_type = tt::run_cli_captured(
                         {"log", id, "--type", "dance", "--text", "x"});
                     require(bad_type.code == 1, "unknown event type");

                     const auto rolled = tt::run_cli_captured(
                         {"roll", "d20", "--seed", "3", "--session", id, "--actor", "Aria"});
                     require(rolled.code == 0, rolled.err);

                     const auto all = tt::run_cli_captured({"events", id});
                     require(all.code == 0, all.err);
                     const auto all_lines = lines_of(all.out);
                     require(all_lines.size() == 2, "two events: " + all.out);
                     require(contains(all_lines[0], "evt_1") && contains(all_lines[0], "narration") &&
                                 contains(all_lines[0], "[dm] Rain falls."),
                             "narration line: " + all_lines[0]);
                     require(contains(all_lines[1], "dice_roll"), "roll line");

                     const auto rolls = tt::run_cli_captured({"events", id, "--type", "dice_roll"});
                     require(lines_of(rolls.out).size() == 1, "type filter");
                     const auto last = tt::run_cli_captured({"events", id, "--last", "1"});
                     require(lines_of(last.out).size() == 1 && contains(last.out, "evt_2"),
                             "last keeps the newest");

                     const auto ended =
                         tt::run_cli_captured({"scene", "end", id, "--summary", "They held the gate."});
                     require(ended.code == 0, ended.err);

                     const auto shown = tt::run_cli_captured({"session", "show", id});
                     require(shown.code == 0, shown.err);
                     require(contains(shown.out, "scenes:       1"), "scene count");
                     require(contains(shown.out, "events:       2"), "event count");
                     require(contains(shown.out, "active_scene: (none)"), "no active scene");

                     const auto listed = tt::run_cli_captured({"session", "list"});
                     require(listed.code == 0 && contains(listed.out, id), "session listed");

                     const auto context = tt::run_cli_captured({"context", id, "--budget", "500"});
                     require(context.code == 0, context.err);
                     require(contains(context.out, "## Gate"), "scene heading: " + context.out);
                     require(contains(context.out, "-- consumed "), "consumption footer");
                     require(contains(context.out, " of 500"), "budget echoed");
                   }});

  tests.push_back({"cli_missing_session_fails", [] {
                     const tt::IsolatedConfigEnv env;
                     write_cli_config(env);
                     const auto shown = tt::run_cli_captured({"session", "show", "session_absent"});
                     require(shown.code == 1, "unknown session");
                     const auto events = tt::run_cli_captured({"events", "session_absent"});
                     require(events.code == 1, "unknown session for events");
                   }});

  tests.push_back({"cli_config_path_option", [] {
                     const tt::IsolatedConfigEnv env;
                     const auto custom = env.home() / "alt.toml";
                     {
                       std::ofstream out(custom);
                       out << "[observability]\nbackend = \"none\"\n[context]\nbudget = 777\n";
                     }
                     const auto shown =
                         tt::run_cli_captured({"--config", custom.string(), "config", "show"});
                     require(shown.code == 0, shown.err);
                     require(contains(shown.out, "context.budget = 777"), "custom file used");

                     const auto path =
                         tt::run_cli_captured({"--config=" + custom.string(), "config", "path"});
                     require(path.code == 0 && first_line(path.out) == custom.string(),
                             "path printed");
                   }});
}
