#include "talekeeper/dice/roller.hpp"

#include "talekeeper/common/time.hpp"
#include "talekeeper/observability/global.hpp"

#include <algorithm>
#include <functional>
#include <sstream>

namespace talekeeper::dice {

namespace {

std::string join_values(const std::vector<int> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << values[i];
  }
  out << "]";
  return out.str();
}

TermResult roll_term(const RollTerm &term, RandomSource &rng) {
  TermResult result;
  result.term = term;
  result.rolls.reserve(static_cast<std::size_t>(term.count));
  for (int i = 0; i < term.count; ++i) {
    result.rolls.push_back(rng.next_uniform_int(1, term.sides));
  }

  result.kept = result.rolls;
  if (term.keep.has_value()) {
    if (term.keep->mode == KeepMode::Highest) {
      std::sort(result.kept.begin(), result.kept.end(), std::greater<int>());
    } else {
      std::sort(result.kept.begin(), result.kept.end());
    }
    result.kept.resize(static_cast<std::size_t>(term.keep->count));
  }

  std::int64_t sum = 0;
  for (const int value : result.kept) {
    sum += value;
  }
  result.subtotal = term.sign < 0 ? -sum : sum;
  return result;
}

std::string spec_label(const DiceSpec &spec) {
  DiceSpec single = spec;
  single.repeat = 1;
  return to_notation(single);
}

} // namespace

RollTerm effective_roll_term(const DiceSpec &spec, const std::size_t index) {
  RollTerm term = std::get<RollTerm>(spec.terms.at(index));
  if (spec.mode != RollMode::Normal && spec.mode_term == index) {
    term.count = 2;
    term.keep = KeepClause{spec.mode == RollMode::Advantage ? KeepMode::Highest : KeepMode::Lowest,
                           1};
  }
  return term;
}

RollResult roll(const DiceSpec &spec, RandomSource &rng, const common::TimestampFn &clock) {
  RollResult result;
  result.spec = spec;
  result.seed = rng.seed();
  result.timestamp = clock ? clock() : common::now_rfc3339();
  result.terms.reserve(spec.terms.size());

  for (std::size_t i = 0; i < spec.terms.size(); ++i) {
    if (std::holds_alternative<RollTerm>(spec.terms[i])) {
      result.terms.push_back(roll_term(effective_roll_term(spec, i), rng));
    } else {
      TermResult modifier;
      modifier.term = spec.terms[i];
      modifier.subtotal = std::get<ModifierTerm>(spec.terms[i]).value;
      result.terms.push_back(std::move(modifier));
    }
    result.total += result.terms.back().subtotal;
  }

  observability::record_dice_roll(spec_label(spec), result.total, result.seed.has_value());
  return result;
}

std::vector<RollResult> roll_repeated(const DiceSpec &spec, RandomSource &rng,
                                      const common::TimestampFn &clock) {
  std::vector<RollResult> results;
  const int count = std::max(spec.repeat, 1);
  results.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    results.push_back(roll(spec, rng, clock));
  }
  return results;
}

common::Result<std::vector<RollResult>>
roll_notation(const std::string_view notation, RandomSource &rng,
              const common::TimestampFn &clock) {
  auto parsed = parse_notation(notation);
  if (!parsed.ok()) {
    return common::Result<std::vector<RollResult>>::failure(parsed.status());
  }
  return common::Result<std::vector<RollResult>>::success(
      roll_repeated(parsed.value(), rng, clock));
}

std::string describe(const RollResult &result) {
  std::string out = spec_label(result.spec) + ":";
  for (std::size_t i = 0; i < result.terms.size(); ++i) {
    const auto &term = result.terms[i];
    out += " ";
    if (const auto *roll_term = std::get_if<RollTerm>(&term.term)) {
      if (roll_term->sign < 0) {
        out += "-";
      } else if (i > 0) {
        out += "+";
      }
      out += join_values(term.rolls);
      if (roll_term->keep.has_value()) {
        out += " kept " + join_values(term.kept);
      }
    } else {
      const auto value = std::get<ModifierTerm>(term.term).value;
      out += (value < 0 ? "-" : "+") + std::to_string(value < 0 ? -value : value);
    }
  }
  out += " = " + std::to_string(result.total);
  return out;
}

std::vector<int> all_rolls(const RollResult &result) {
  std::vector<int> out;
  for (const auto &term : result.terms) {
    out.insert(out.end(), term.rolls.begin(), term.rolls.end());
  }
  return out;
}

std::vector<int> all_kept(const RollResult &result) {
  std::vector<int> out;
  for (const auto &term : result.terms) {
    out.insert(out.end(), term.kept.begin(), term.kept.end());
  }
  return out;
}

} // namespace talekeeper::dice
