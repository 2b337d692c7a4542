#include "test_framework.hpp"

#include "talekeeper/common/fs.hpp"
#include "talekeeper/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<talekeeper::tests::TestCase> &tests) {
  using talekeeper::tests::require;
  namespace cfg = talekeeper::config;
  namespace cm = talekeeper::common;
  namespace tt = talekeeper::testing;

  tests.push_back({"config_dir_creates_directory", [] {
                     const tt::IsolatedConfigEnv env;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value() == env.home() / ".talekeeper", "under HOME");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const tt::IsolatedConfigEnv env;
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.persistence.backend == "file", "default backend should be file");
                     require(config.persistence.auto_save, "auto-save on by default");
                     require(config.dice.rng == "crypto", "crypto dice by default");
                     require(!config.dice.seed.has_value(), "no seed by default");
                     require(config.context.budget == 4000, "default budget");
                     require(config.context.recent_scene_window == 2, "default window");
                     require(config.observability.backend == "log", "log observer by default");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const tt::IsolatedConfigEnv env;
                     write_file(env.config_file(), R"(
data_dir = "/srv/talekeeper"   # campaign storage

[persistence]
backend = "SQLite"
auto_save = false

[dice]
rng = "seeded"
seed = 1_234

[context]
budget = 1500
recent_scene_window = 3
chars_per_token = 3

[observability]
backend = "log,none"
)");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.data_dir == "/srv/talekeeper", "data dir");
                     require(config.persistence.backend == "sqlite", "backend lower-cased");
                     require(!config.persistence.auto_save, "auto-save off");
                     require(config.dice.rng == "seeded", "rng");
                     require(config.dice.seed == std::optional<std::uint64_t>(1234), "seed");
                     require(config.context.budget == 1500, "budget");
                     require(config.context.recent_scene_window == 3, "window");
                     require(config.context.chars_per_token == 3, "chars per token");
                     require(config.observability.backend == "log,none", "observers");
                   }});

  tests.push_back({"partial_toml_fills_defaults", [] {
                     const tt::IsolatedConfigEnv env;
                     write_file(env.config_file(), "[context]\nbudget = 800\n");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().context.budget == 800, "budget should be overridden");
                     require(loaded.value().context.recent_scene_window == 2, "window keeps default");
                     require(loaded.value().persistence.backend == "file", "backend keeps default");
                   }});

  tests.push_back({"parse_config_rejects_bad_seed", [] {
                     auto negative = cfg::parse_config("[dice]\nseed = -5\n");
                     require(!negative.ok(), "negative seed rejected");
                     require(negative.code() == cm::ErrorCode::ConfigError, "ConfigError");
                     auto text = cfg::parse_config("[dice]\nseed = \"lucky\"\n");
                     require(!text.ok(), "string seed rejected");
                   }});

  tests.push_back({"load_config_reports_file_on_error", [] {
                     const tt::IsolatedConfigEnv env;
                     write_file(env.config_file(), "[dice]\nseed = nope\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "bad file should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error names the file: " + loaded.error());
                   }});

  tests.push_back({"env_overrides_apply", [] {
                     const tt::IsolatedConfigEnv env;
                     const tt::EnvGuard data_dir("TALEKEEPER_DATA_DIR", "/tmp/tk-data");
                     const tt::EnvGuard backend("TALEKEEPER_PERSISTENCE_BACKEND", " None ");
                     const tt::EnvGuard budget("TALEKEEPER_CONTEXT_BUDGET", "250");
                     const tt::EnvGuard seed("TALEKEEPER_DICE_SEED", "99");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.data_dir == "/tmp/tk-data", "data dir from env");
                     require(config.persistence.backend == "none", "backend from env");
                     require(config.context.budget == 250, "budget from env");
                     require(config.dice.rng == "seeded" &&
                                 config.dice.seed == std::optional<std::uint64_t>(99),
                             "seed from env switches to seeded dice");
                   }});

  tests.push_back({"env_override_ignores_unparseable_numbers", [] {
                     const tt::IsolatedConfigEnv env;
                     const tt::EnvGuard budget("TALEKEEPER_CONTEXT_BUDGET", "lots");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().context.budget == 4000, "default kept");
                   }});

  tests.push_back({"dotenv_file_supplies_missing_variables", [] {
                     const tt::IsolatedConfigEnv env;
                     write_file(env.home() / "custom.env",
                                "# comment\nexport TALEKEEPER_CONTEXT_BUDGET=\"321\"\n");
                     const tt::EnvGuard env_file("TALEKEEPER_ENV_FILE",
                                                 (env.home() / "custom.env").string());
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().context.budget == 321, "budget from .env file");
                   }});

  tests.push_back({"config_path_override_and_env", [] {
                     const tt::IsolatedConfigEnv env;
                     const auto explicit_file = env.home() / "elsewhere" / "tk.toml";
                     {
                       const tt::ConfigOverrideGuard guard(explicit_file);
                       const auto path = cfg::config_path();
                       require(path.ok() && path.value() == explicit_file, "override file used");
                     }
                     {
                       std::filesystem::create_directories(env.home() / "confdir");
                       const tt::EnvGuard path_env("TALEKEEPER_CONFIG_PATH",
                                                   (env.home() / "confdir").string());
                       const auto path = cfg::config_path();
                       require(path.ok() &&
                                   path.value() == env.home() / "confdir" / "config.toml",
                               "directory override gets the default file name");
                     }
                   }});

  tests.push_back({"save_config_round_trip", [] {
                     const tt::IsolatedConfigEnv env;
                     auto config = tt::mock_config();
                     config.data_dir = "~/campaigns";
                     config.persistence.backend = "sqlite";
                     config.context.budget = 2048;
                     config.observability.backend = "log";
                     require(cfg::save_config(config).ok(), "save should succeed");
                     require(cfg::config_exists(), "config file written");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir == "~/campaigns", "data dir");
                     require(loaded.value().persistence.backend == "sqlite", "backend");
                     require(loaded.value().dice.seed == std::optional<std::uint64_t>(42), "seed");
                     require(loaded.value().context.budget == 2048, "budget");
                     require(cfg::resolved_data_dir(loaded.value()) == env.home() / "campaigns",
                             "tilde expanded against HOME");
                   }});

  tests.push_back({"validate_config_errors", [] {
                     const auto expect_error = [](cfg::Config config, const std::string &label) {
                       const auto result = cfg::validate_config(config);
                       require(!result.ok(), "expected validation error: " + label);
                       require(result.code() == cm::ErrorCode::ConfigError, "ConfigError: " + label);
                     };
                     cfg::Config base;
                     require(cfg::validate_config(base).ok(), "defaults are valid");

                     auto empty_dir = base;
                     empty_dir.data_dir = "  ";
                     expect_error(empty_dir, "empty data dir");

                     auto backend = base;
                     backend.persistence.backend = "tape";
                     expect_error(backend, "backend");

                     auto rng = base;
                     rng.dice.rng = "dice-tower";
                     expect_error(rng, "rng");

                     auto budget = base;
                     budget.context.budget = 0;
                     expect_error(budget, "budget");

                     auto chars = base;
                     chars.context.chars_per_token = 0;
                     expect_error(chars, "chars per token");

                     auto observer = base;
                     observer.observability.backend = "log,prometheus";
                     expect_error(observer, "observer");
                   }});

  tests.push_back({"validate_config_warnings", [] {
                     cfg::Config config;
                     config.persistence.backend = "none";
                     config.dice.seed = 3;
                     config.context.recent_scene_window = 0;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 3, "three warnings");
                     require(has_warning(result.value(), "auto_save"), "auto-save warning");
                     require(has_warning(result.value(), "dice.seed is ignored"), "seed warning");
                     require(has_warning(result.value(), "recent_scene_window"), "window warning");

                     cfg::Config seeded;
                     seeded.dice.rng = "seeded";
                     const auto drawn = cfg::validate_config(seeded);
                     require(drawn.ok() && has_warning(drawn.value(), "random seed"),
                             "seeded without seed warns");
                   }});
}
