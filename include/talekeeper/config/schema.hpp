#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace talekeeper::config {

struct PersistenceConfig {
  std::string backend = "file";
  bool auto_save = true;
};

struct DiceConfig {
  std::string rng = "crypto";
  std::optional<std::uint64_t> seed;
};

struct ContextConfig {
  std::uint64_t budget = 4000;
  std::uint64_t recent_scene_window = 2;
  std::uint64_t chars_per_token = 4;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string data_dir = "~/.talekeeper/data";
  PersistenceConfig persistence;
  DiceConfig dice;
  ContextConfig context;
  ObservabilityConfig observability;
};

} // namespace talekeeper::config
