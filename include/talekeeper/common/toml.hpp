#pragma once

#include "talekeeper/common/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace talekeeper::common {

/// Flat view of a TOML subset: `[section]` headers, `key = value` lines, strings, integers,
/// floats, booleans and single-line arrays. Keys are stored fully qualified ("context.budget").
struct TomlDocument {
  std::map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::optional<std::string> find_string(const std::string &key) const;
  [[nodiscard]] std::optional<std::uint64_t> find_u64(const std::string &key) const;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace talekeeper::common
