#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/common/time.hpp"
#include "talekeeper/dice/notation.hpp"
#include "talekeeper/dice/random.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace talekeeper::dice {

struct TermResult {
  /// The term as evaluated; an advantage d20 appears here as 2d20kh1.
  DiceTerm term;
  std::vector<int> rolls;
  /// Retained values in keep order (descending for highest, ascending for lowest).
  std::vector<int> kept;
  std::int64_t subtotal = 0;
};

struct RollResult {
  DiceSpec spec;
  std::vector<TermResult> terms;
  std::int64_t total = 0;
  std::optional<std::uint64_t> seed;
  std::string timestamp;
};

/// The roll term at `index` after advantage/disadvantage is reduced to 2dNkh1 / 2dNkl1.
[[nodiscard]] RollTerm effective_roll_term(const DiceSpec &spec, std::size_t index);

/// One evaluation of the spec, ignoring its repeat count. `clock` stamps the result.
[[nodiscard]] RollResult roll(const DiceSpec &spec, RandomSource &rng,
                              const common::TimestampFn &clock = common::system_clock_fn());

/// `spec.repeat` independent results.
[[nodiscard]] std::vector<RollResult>
roll_repeated(const DiceSpec &spec, RandomSource &rng,
              const common::TimestampFn &clock = common::system_clock_fn());

/// Parse and roll; one result per repeat.
[[nodiscard]] common::Result<std::vector<RollResult>>
roll_notation(std::string_view notation, RandomSource &rng,
              const common::TimestampFn &clock = common::system_clock_fn());

/// "4d6kh3: [5, 3, 6, 1] kept [6, 5, 3] = 14"
[[nodiscard]] std::string describe(const RollResult &result);

/// Every raw value across all roll terms, in draw order.
[[nodiscard]] std::vector<int> all_rolls(const RollResult &result);
[[nodiscard]] std::vector<int> all_kept(const RollResult &result);

} // namespace talekeeper::dice
