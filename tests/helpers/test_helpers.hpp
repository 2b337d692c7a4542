#pragma once

#include "talekeeper/common/time.hpp"
#include "talekeeper/config/schema.hpp"
#include "talekeeper/dice/random.hpp"
#include "talekeeper/generation/generator.hpp"
#include "talekeeper/observability/observer.hpp"
#include "talekeeper/persistence/sink.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace talekeeper::testing {

config::Config mock_config();

/// Sets or unsets an environment variable, restoring the previous value on destruction.
struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;
};

/// 2026-10-18T12:00:00.000Z advanced by one second on every call.
common::TimestampFn stepping_clock();

/// Hands out the queued values in order. Throws when exhausted or when a value falls outside
/// the requested range.
class FixedSequenceRandomSource final : public dice::RandomSource {
public:
  explicit FixedSequenceRandomSource(std::vector<int> values);

  [[nodiscard]] int next_uniform_int(int low, int high) override;
  [[nodiscard]] std::string_view name() const override { return "fixed"; }

  [[nodiscard]] std::size_t draws() const { return next_; }

private:
  std::vector<int> values_;
  std::size_t next_ = 0;
};

class MockGenerator final : public generation::Generator {
public:
  void set_response(std::string text);
  void set_tool_call(std::string tool, std::string arguments);
  void set_error(std::string error_message);

  [[nodiscard]] common::Result<generation::GenerationReply>
  generate(const context::ContextPackage &context, const std::string &prompt) override;
  [[nodiscard]] std::string name() const override { return "mock"; }

  [[nodiscard]] std::size_t calls() const { return calls_; }
  [[nodiscard]] const std::string &last_prompt() const { return last_prompt_; }
  [[nodiscard]] const context::ContextPackage &last_context() const { return last_context_; }

private:
  std::optional<generation::GenerationReply> reply_;
  std::optional<std::string> error_;
  std::size_t calls_ = 0;
  std::string last_prompt_;
  context::ContextPackage last_context_;
};

/// Keeps encoded documents in memory. Saves can be switched to fail for storage-error paths.
class MemorySessionSink final : public persistence::SessionSink {
public:
  [[nodiscard]] common::Status save(const sessions::Session &session) override;
  [[nodiscard]] common::Result<sessions::Session> load(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  void set_fail_saves(bool fail) { fail_saves_ = fail; }
  [[nodiscard]] std::size_t saves() const { return saves_; }
  [[nodiscard]] std::size_t failed_saves() const { return failed_saves_; }
  [[nodiscard]] std::optional<std::string> document(const std::string &session_id) const;

private:
  std::map<std::string, std::string> documents_;
  bool fail_saves_ = false;
  std::size_t saves_ = 0;
  std::size_t failed_saves_ = 0;
};

struct RecordedSignals {
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::size_t n = 0;
    for (const auto &event : events) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }
};

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(RecordedSignals *signals) : signals_(signals) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  RecordedSignals *signals_ = nullptr;
};

/// Installs a RecordingObserver as the global observer for its lifetime.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  [[nodiscard]] const RecordedSignals &signals() const { return signals_; }

private:
  RecordedSignals signals_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Temporary HOME with every TALEKEEPER_* variable cleared and no config path override.
class IsolatedConfigEnv {
public:
  IsolatedConfigEnv();

  [[nodiscard]] const std::filesystem::path &home() const { return home_.path(); }
  [[nodiscard]] std::filesystem::path config_file() const {
    return home() / ".talekeeper" / "config.toml";
  }

private:
  TempWorkspace home_;
  EnvGuard home_env_;
  EnvGuard config_path_env_;
  EnvGuard env_file_env_;
  EnvGuard data_dir_env_;
  EnvGuard backend_env_;
  EnvGuard budget_env_;
  EnvGuard seed_env_;
  ConfigOverrideGuard override_;
};

struct CliResult {
  int code = 0;
  std::string out;
  std::string err;
};

/// Runs the command-line entry point with stdout and stderr captured. The global observer the
/// CLI installs is removed afterwards.
CliResult run_cli_captured(const std::vector<std::string> &args);

/// mock_config() with its data directory inside the workspace.
config::Config temp_config(const TempWorkspace &workspace);

} // namespace talekeeper::testing
