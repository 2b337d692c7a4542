#include "talekeeper/config/config.hpp"

#include "talekeeper/common/fs.hpp"
#include "talekeeper/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace talekeeper::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".talekeeper";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TALEKEEPER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TALEKEEPER_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::ConfigError, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.status());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  if (!path.ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

std::filesystem::path resolved_data_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.data_dir));
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *dir = std::getenv("TALEKEEPER_DATA_DIR"); dir != nullptr && *dir) {
    config.data_dir = dir;
  }
  if (const char *backend = std::getenv("TALEKEEPER_PERSISTENCE_BACKEND");
      backend != nullptr && *backend) {
    config.persistence.backend = common::to_lower(common::trim(backend));
  }
  if (const char *budget = std::getenv("TALEKEEPER_CONTEXT_BUDGET"); budget != nullptr && *budget) {
    if (const auto parsed = parse_u64(budget); parsed.has_value()) {
      config.context.budget = *parsed;
    }
  }
  if (const char *seed = std::getenv("TALEKEEPER_DICE_SEED"); seed != nullptr && *seed) {
    if (const auto parsed = parse_u64(seed); parsed.has_value()) {
      config.dice.rng = "seeded";
      config.dice.seed = *parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.data_dir = doc.get_string("data_dir", config.data_dir);

  config.persistence.backend =
      common::to_lower(doc.get_string("persistence.backend", config.persistence.backend));
  config.persistence.auto_save = doc.get_bool("persistence.auto_save", config.persistence.auto_save);

  config.dice.rng = common::to_lower(doc.get_string("dice.rng", config.dice.rng));
  if (doc.has("dice.seed")) {
    const auto seed = doc.find_u64("dice.seed");
    if (!seed.has_value()) {
      return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                             "dice.seed must be an unsigned integer");
    }
    config.dice.seed = *seed;
  }

  config.context.budget = doc.get_u64("context.budget", config.context.budget);
  config.context.recent_scene_window =
      doc.get_u64("context.recent_scene_window", config.context.recent_scene_window);
  config.context.chars_per_token =
      doc.get_u64("context.chars_per_token", config.context.chars_per_token);

  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           "Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.code(),
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }

  std::ostringstream file;
  file << "data_dir = " << common::quote_toml_string(config.data_dir) << "\n";

  file << "\n[persistence]\n";
  file << "backend = " << common::quote_toml_string(config.persistence.backend) << "\n";
  file << "auto_save = " << bool_to_toml(config.persistence.auto_save) << "\n";

  file << "\n[dice]\n";
  file << "rng = " << common::quote_toml_string(config.dice.rng) << "\n";
  if (config.dice.seed.has_value()) {
    file << "seed = " << *config.dice.seed << "\n";
  }

  file << "\n[context]\n";
  file << "budget = " << config.context.budget << "\n";
  file << "recent_scene_window = " << config.context.recent_scene_window << "\n";
  file << "chars_per_token = " << config.context.chars_per_token << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.data_dir).empty()) {
    return Warnings::failure(common::ErrorCode::ConfigError, "data_dir must not be empty");
  }

  const std::string backend = common::to_lower(config.persistence.backend);
  if (backend != "file" && backend != "sqlite" && backend != "none") {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "Invalid persistence.backend: " + config.persistence.backend);
  }
  if (backend == "none" && config.persistence.auto_save) {
    warnings.push_back("persistence.auto_save has no effect with backend \"none\"");
  }

  const std::string rng = common::to_lower(config.dice.rng);
  if (rng != "crypto" && rng != "seeded") {
    return Warnings::failure(common::ErrorCode::ConfigError, "Invalid dice.rng: " + config.dice.rng);
  }
  if (rng == "crypto" && config.dice.seed.has_value()) {
    warnings.push_back("dice.seed is ignored when dice.rng is \"crypto\"");
  }
  if (rng == "seeded" && !config.dice.seed.has_value()) {
    warnings.push_back("dice.rng is \"seeded\" without dice.seed; a random seed will be drawn");
  }

  if (config.context.budget == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError, "context.budget must be positive");
  }
  if (config.context.chars_per_token == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "context.chars_per_token must be positive");
  }
  if (config.context.recent_scene_window == 0) {
    warnings.push_back("context.recent_scene_window is 0; ended scenes appear only as summaries");
  }

  std::stringstream observers(common::to_lower(config.observability.backend));
  std::string observer;
  while (std::getline(observers, observer, ',')) {
    observer = common::trim(observer);
    if (!observer.empty() && observer != "log" && observer != "none" && observer != "noop") {
      return Warnings::failure(common::ErrorCode::ConfigError,
                               "Invalid observability.backend entry: " + observer);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace talekeeper::config
