#include "talekeeper/cli/commands.hpp"

#include "talekeeper/common/fs.hpp"
#include "talekeeper/config/config.hpp"
#include "talekeeper/context/assembler.hpp"
#include "talekeeper/dice/random.hpp"
#include "talekeeper/dice/roller.hpp"
#include "talekeeper/observability/factory.hpp"
#include "talekeeper/observability/global.hpp"
#include "talekeeper/persistence/sink.hpp"
#include "talekeeper/sessions/log.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace talekeeper::cli {

namespace {

std::string version_string() {
#ifdef TALEKEEPER_VERSION
  return std::string("talekeeper ") + TALEKEEPER_VERSION;
#else
  return "talekeeper 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &long_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(args[i + 1]));
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(value));
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

/// Loaded configuration plus the observer and sink built from it.
struct Environment {
  config::Config config;
  std::shared_ptr<persistence::SessionSink> sink;
};

std::optional<Environment> load_environment() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return std::nullopt;
  }

  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto sink = persistence::make_session_sink(cfg.value());
  if (!sink.ok()) {
    std::cerr << sink.error() << "\n";
    return std::nullopt;
  }

  Environment env;
  env.config = std::move(cfg.value());
  env.sink = std::shared_ptr<persistence::SessionSink>(std::move(sink.value()));
  return env;
}

std::unique_ptr<sessions::SessionLog> open_log(const Environment &env, const std::string &id) {
  auto log = sessions::SessionLog::open(env.sink, id, env.config.persistence.auto_save);
  if (!log.ok()) {
    std::cerr << log.error() << "\n";
    return nullptr;
  }
  return std::move(log.value());
}

// Saves anything auto-save left behind; the process is about to exit.
int finish(sessions::SessionLog &log) {
  auto flushed = log.flush();
  if (!flushed.ok()) {
    std::cerr << flushed.error() << "\n";
    return 1;
  }
  return 0;
}

void print_event(const sessions::Event &event) {
  std::cout << event.id << "  " << event.timestamp << "  "
            << sessions::event_type_to_string(event.type()) << "  "
            << context::render_event_line(event) << "\n";
}

int run_roll(std::vector<std::string> args) {
  std::string seed_raw;
  const bool has_seed = take_option(args, "--seed", "-s", seed_raw);
  std::string session_id;
  const bool log_to_session = take_option(args, "--session", "", session_id);
  std::string actor;
  const bool has_actor = take_option(args, "--actor", "-a", actor);

  if (args.empty()) {
    std::cerr << "usage: talekeeper roll <notation> [--seed N] [--session ID [--actor A]]\n";
    return 1;
  }
  std::string notation;
  for (std::size_t i = 0; i < args.size(); ++i) {
    notation += (i > 0 ? " " : "") + args[i];
  }

  auto env = load_environment();
  if (!env.has_value()) {
    return 1;
  }

  std::unique_ptr<dice::RandomSource> rng;
  if (has_seed) {
    const auto seed = parse_u64(seed_raw);
    if (!seed.has_value()) {
      std::cerr << "invalid seed: " << seed_raw << "\n";
      return 1;
    }
    rng = std::make_unique<dice::SeededRandomSource>(*seed);
  } else {
    auto made = dice::make_random_source(env->config.dice);
    if (!made.ok()) {
      std::cerr << made.error() << "\n";
      return 1;
    }
    rng = std::move(made.value());
  }

  auto results = dice::roll_notation(notation, *rng);
  if (!results.ok()) {
    std::cerr << results.error() << "\n";
    return 1;
  }
  for (const auto &result : results.value()) {
    std::cout << dice::describe(result) << "\n";
  }
  if (rng->seed().has_value()) {
    std::cout << "seed: " << *rng->seed() << "\n";
  }

  if (!log_to_session) {
    return 0;
  }
  auto log = open_log(*env, session_id);
  if (!log) {
    return 1;
  }
  for (const auto &result : results.value()) {
    auto logged = log->log_roll(result, has_actor ? std::optional<std::string>(actor) : std::nullopt);
    if (!logged.ok()) {
      std::cerr << logged.error() << "\n";
      return 1;
    }
  }
  return finish(*log);
}

int run_session(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: talekeeper session <new|list|show> [id]\n";
    return 1;
  }
  const std::string subcommand = args[0];
  args.erase(args.begin());

  auto env = load_environment();
  if (!env.has_value()) {
    return 1;
  }

  if (subcommand == "new") {
    auto log = sessions::SessionLog::create(env->sink, env->config.persistence.auto_save);
    if (!log.ok()) {
      std::cerr << log.error() << "\n";
      return 1;
    }
    std::cout << log.value()->id() << "\n";
    return finish(*log.value());
  }

  if (subcommand == "list") {
    if (!env->sink) {
      std::cerr << "no persistence backend configured\n";
      return 1;
    }
    auto ids = env->sink->list();
    if (!ids.ok()) {
      std::cerr << ids.error() << "\n";
      return 1;
    }
    for (const auto &id : ids.value()) {
      std::cout << id << "\n";
    }
    return 0;
  }

  if (subcommand == "show") {
    if (args.empty()) {
      std::cerr << "usage: talekeeper session show <id>\n";
      return 1;
    }
    auto log = open_log(*env, args[0]);
    if (!log) {
      return 1;
    }
    const auto session = log->snapshot();
    const auto stats = session.stats();
    std::cout << "id:           " << session.id() << "\n";
    std::cout << "created_at:   " << session.created_at() << "\n";
    std::cout << "scenes:       " << stats.scene_count << "\n";
    std::cout << "events:       " << stats.event_count << "\n";
    std::cout << "active_scene: " << stats.active_scene_id.value_or("(none)") << "\n";
    if (stats.first_event_at.has_value()) {
      std::cout << "first_event:  " << *stats.first_event_at << "\n";
      std::cout << "last_event:   " << stats.last_event_at.value_or("") << "\n";
    }
    for (const auto &[type, count] : stats.events_by_type) {
      std::cout << "  " << type << ": " << count << "\n";
    }
    for (const auto &scene : session.scenes()) {
      std::cout << "- " << scene.id << " \"" << scene.title << "\"";
      if (!scene.location.empty()) {
        std::cout << " @ " << scene.location;
      }
      std::cout << (scene.active ? " [active]" : "") << " (" << scene.events.size()
                << " events)\n";
    }
    return 0;
  }

  std::cerr << "unknown session subcommand: " << subcommand << "\n";
  return 1;
}

int run_scene(std::vector<std::string> args) {
  if (args.size() < 2) {
    std::cerr << "usage: talekeeper scene <start|end> <session> [options]\n";
    return 1;
  }
  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "start") {
    std::string title;
    std::string location;
    if (!take_option(args, "--title", "-t", title)) {
      std::cerr << "usage: talekeeper scene start <session> --title T [--location L] "
                   "[--participant A]...\n";
      return 1;
    }
    (void)take_option(args, "--location", "-l", location);
    const auto participants = take_repeated_option(args, "--participant");
    if (args.empty()) {
      std::cerr << "missing session id\n";
      return 1;
    }

    auto env = load_environment();
    if (!env.has_value()) {
      return 1;
    }
    auto log = open_log(*env, args[0]);
    if (!log) {
      return 1;
    }
    auto started = log->start_scene(title, location, participants);
    if (!started.ok()) {
      std::cerr << started.error() << "\n";
      return 1;
    }
    std::cout << started.value() << "\n";
    return finish(*log);
  }

  if (subcommand == "end") {
    std::string summary;
    const bool has_summary = take_option(args, "--summary", "-s", summary);
    if (args.empty()) {
      std::cerr << "missing session id\n";
      return 1;
    }

    auto env = load_environment();
    if (!env.has_value()) {
      return 1;
    }
    auto log = open_log(*env, args[0]);
    if (!log) {
      return 1;
    }
    auto ended =
        log->end_scene(has_summary ? std::optional<std::string>(summary) : std::nullopt);
    if (!ended.ok()) {
      std::cerr << ended.error() << "\n";
      return 1;
    }
    return finish(*log);
  }

  std::cerr << "unknown scene subcommand: " << subcommand << "\n";
  return 1;
}

int run_log(std::vector<std::string> args) {
  std::string type_name;
  std::string text;
  std::string actor;
  if (!take_option(args, "--type", "", type_name) || !take_option(args, "--text", "", text)) {
    std::cerr << "usage: talekeeper log <session> --type T --text X [--actor A] "
                 "[--meta key=value]...\n";
    return 1;
  }
  const bool has_actor = take_option(args, "--actor", "-a", actor);
  sessions::EventMetadata metadata;
  for (const auto &pair : take_repeated_option(args, "--meta")) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid --meta value (expected key=value): " << pair << "\n";
      return 1;
    }
    metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
  }
  if (args.empty()) {
    std::cerr << "missing session id\n";
    return 1;
  }

  const auto type = sessions::event_type_from_string(type_name);
  if (!type.has_value()) {
    std::cerr << "unknown event type: " << type_name << "\n";
    return 1;
  }

  auto env = load_environment();
  if (!env.has_value()) {
    return 1;
  }
  auto log = open_log(*env, args[0]);
  if (!log) {
    return 1;
  }
  auto logged = log->log_text_event(*type, text,
                                    has_actor ? std::optional<std::string>(actor) : std::nullopt,
                                    std::move(metadata));
  if (!logged.ok()) {
    std::cerr << logged.error() << "\n";
    return 1;
  }
  std::cout << logged.value() << "\n";
  return finish(*log);
}

int run_events(std::vector<std::string> args) {
  sessions::EventFilter filter;
  std::string value;
  if (take_option(args, "--type", "", value)) {
    filter.type = sessions::event_type_from_string(value);
    if (!filter.type.has_value()) {
      std::cerr << "unknown event type: " << value << "\n";
      return 1;
    }
  }
  if (take_option(args, "--actor", "-a", value)) {
    filter.actor = value;
  }
  if (take_option(args, "--scene", "", value)) {
    filter.scene_id = value;
  }
  if (take_option(args, "--from", "", value)) {
    filter.time_range.from = value;
  }
  if (take_option(args, "--to", "", value)) {
    filter.time_range.to = value;
  }
  std::optional<std::size_t> last;
  if (take_option(args, "--last", "", value)) {
    const auto parsed = parse_u64(value);
    if (!parsed.has_value()) {
      std::cerr << "invalid --last value: " << value << "\n";
      return 1;
    }
    last = static_cast<std::size_t>(*parsed);
  }
  if (args.empty()) {
    std::cerr << "usage: talekeeper events <session> [--type T] [--actor A] [--scene S] "
                 "[--from TS] [--to TS] [--last N]\n";
    return 1;
  }

  auto env = load_environment();
  if (!env.has_value()) {
    return 1;
  }
  auto log = open_log(*env, args[0]);
  if (!log) {
    return 1;
  }

  auto events = log->query_events(filter);
  if (last.has_value() && events.size() > *last) {
    events.erase(events.begin(), events.end() - static_cast<long>(*last));
  }
  for (const auto &event : events) {
    print_event(event);
  }
  return 0;
}

int run_context(std::vector<std::string> args) {
  std::string budget_raw;
  std::string window_raw;
  const bool has_budget = take_option(args, "--budget", "-b", budget_raw);
  const bool has_window = take_option(args, "--window", "-w", window_raw);
  if (args.empty()) {
    std::cerr << "usage: talekeeper context <session> [--budget N] [--window N]\n";
    return 1;
  }

  auto env = load_environment();
  if (!env.has_value()) {
    return 1;
  }

  context::AssemblerOptions options = context::options_from_config(env->config.context);
  context::TokenBudget budget{static_cast<std::size_t>(env->config.context.budget)};
  if (has_budget) {
    const auto parsed = parse_u64(budget_raw);
    if (!parsed.has_value()) {
      std::cerr << "invalid --budget value: " << budget_raw << "\n";
      return 1;
    }
    budget.limit = static_cast<std::size_t>(*parsed);
  }
  if (has_window) {
    const auto parsed = parse_u64(window_raw);
    if (!parsed.has_value()) {
      std::cerr << "invalid --window value: " << window_raw << "\n";
      return 1;
    }
    options.recent_scene_window = static_cast<std::size_t>(*parsed);
  }

  auto log = open_log(*env, args[0]);
  if (!log) {
    return 1;
  }
  const context::ContextAssembler assembler(std::move(options));
  const auto package = assembler.build(log->snapshot(), budget);
  std::cout << context::render_context(package);
  std::cout << "\n-- consumed " << package.consumed << " of " << package.budget
            << (package.over_budget ? " (current scene exceeds budget)" : "") << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "unknown config command\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &c = cfg.value();
  std::cout << "data_dir = " << config::resolved_data_dir(c).string() << "\n";
  std::cout << "persistence.backend = " << c.persistence.backend << "\n";
  std::cout << "persistence.auto_save = " << (c.persistence.auto_save ? "true" : "false") << "\n";
  std::cout << "dice.rng = " << c.dice.rng << "\n";
  if (c.dice.seed.has_value()) {
    std::cout << "dice.seed = " << *c.dice.seed << "\n";
  }
  std::cout << "context.budget = " << c.context.budget << "\n";
  std::cout << "context.recent_scene_window = " << c.context.recent_scene_window << "\n";
  std::cout << "context.chars_per_token = " << c.context.chars_per_token << "\n";
  std::cout << "observability.backend = " << c.observability.backend << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: talekeeper [--config PATH] <command> [args]\n\n";
  std::cout << "  roll <notation> [--seed N] [--session ID [--actor A]]\n";
  std::cout << "                         Roll dice, e.g. 4d6kh3, 2d20+5, d20adv, 6#4d6kh3\n";
  std::cout << "  session new            Create a session and print its id\n";
  std::cout << "  session list           List saved sessions\n";
  std::cout << "  session show <id>      Show scenes and event counts\n";
  std::cout << "  scene start <id> --title T [--location L] [--participant A]...\n";
  std::cout << "  scene end <id> [--summary S]\n";
  std::cout << "  log <id> --type T --text X [--actor A] [--meta k=v]...\n";
  std::cout << "  events <id> [--type T] [--actor A] [--scene S] [--from TS] [--to TS] [--last N]\n";
  std::cout << "  context <id> [--budget N] [--window N]\n";
  std::cout << "                         Print the context a generator would receive\n";
  std::cout << "  config [show|path]\n";
  std::cout << "  version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  int code = 1;
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    code = 0;
  } else if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    code = 0;
  } else if (subcommand == "roll") {
    code = run_roll(std::move(args));
  } else if (subcommand == "session") {
    code = run_session(std::move(args));
  } else if (subcommand == "scene") {
    code = run_scene(std::move(args));
  } else if (subcommand == "log") {
    code = run_log(std::move(args));
  } else if (subcommand == "events") {
    code = run_events(std::move(args));
  } else if (subcommand == "context") {
    code = run_context(std::move(args));
  } else if (subcommand == "config") {
    code = run_config(std::move(args));
  } else {
    std::cerr << "unknown command: " << subcommand << "\n";
    print_help();
  }

  if (auto *observer = observability::get_global_observer()) {
    observer->flush();
  }
  return code;
}

} // namespace talekeeper::cli
