#pragma once

#include "talekeeper/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace talekeeper::dice {

constexpr int kMaxDiceCount = 1000;
constexpr int kMaxSides = 1'000'000;
constexpr int kMaxRepeat = 100;
constexpr std::int64_t kMaxModifier = 1'000'000'000;

enum class KeepMode {
  Highest,
  Lowest,
};

struct KeepClause {
  KeepMode mode = KeepMode::Highest;
  int count = 1;

  bool operator==(const KeepClause &) const = default;
};

/// `count` dice with `sides` faces; sign is -1 for a subtracted group ("1d20-1d4").
struct RollTerm {
  int count = 1;
  int sides = 20;
  std::optional<KeepClause> keep;
  int sign = 1;

  bool operator==(const RollTerm &) const = default;
};

struct ModifierTerm {
  std::int64_t value = 0;

  bool operator==(const ModifierTerm &) const = default;
};

using DiceTerm = std::variant<RollTerm, ModifierTerm>;

enum class RollMode {
  Normal,
  Advantage,
  Disadvantage,
};

struct DiceSpec {
  std::vector<DiceTerm> terms;
  RollMode mode = RollMode::Normal;
  /// Index into `terms` of the roll term the advantage/disadvantage suffix is attached to.
  std::optional<std::size_t> mode_term;
  int repeat = 1;
  /// Source text as the caller wrote it.
  std::string notation;

  bool operator==(const DiceSpec &) const = default;
};

[[nodiscard]] std::string roll_mode_to_string(RollMode mode);

/// Parse dice notation such as "4d6kh3", "2d20+5", "d20adv" or "6#4d6kh3".
/// Fails with ErrorCode::InvalidNotation; never rolls anything.
[[nodiscard]] common::Result<DiceSpec> parse_notation(std::string_view text);

/// Canonical notation for a spec ("d20" comes back as "1d20").
[[nodiscard]] std::string to_notation(const DiceSpec &spec);

} // namespace talekeeper::dice
