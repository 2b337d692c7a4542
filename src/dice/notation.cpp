#include "talekeeper/dice/notation.hpp"

#include <cctype>

namespace talekeeper::dice {

namespace {

using ParseResult = common::Result<DiceSpec>;

class NotationParser {
public:
  explicit NotationParser(std::string_view text) : original_(text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
      const auto ch = static_cast<unsigned char>(text[i]);
      if (std::isspace(ch) != 0) {
        continue;
      }
      compact_.push_back(static_cast<char>(std::tolower(ch)));
      columns_.push_back(i);
    }
  }

  ParseResult parse() {
    if (compact_.empty()) {
      return ParseResult::failure(common::ErrorCode::InvalidNotation, "empty dice notation");
    }

    DiceSpec spec;
    spec.notation = std::string(original_);

    if (!parse_repeat_prefix(spec)) {
      return fail();
    }

    int sign = 1;
    if (peek() == '+' || peek() == '-') {
      sign = peek() == '-' ? -1 : 1;
      ++pos_;
    }

    while (true) {
      if (!parse_term(spec, sign)) {
        return fail();
      }
      if (at_end()) {
        break;
      }
      const char op = peek();
      if (op != '+' && op != '-') {
        set_error("unexpected character '" + std::string(1, op) + "'");
        return fail();
      }
      sign = op == '-' ? -1 : 1;
      ++pos_;
      if (at_end()) {
        set_error("expected a term after '" + std::string(1, op) + "'");
        return fail();
      }
    }

    bool has_roll = false;
    for (const auto &term : spec.terms) {
      if (std::holds_alternative<RollTerm>(term)) {
        has_roll = true;
        break;
      }
    }
    if (!has_roll) {
      pos_ = 0;
      set_error("expression has no dice");
      return fail();
    }
    return ParseResult::success(std::move(spec));
  }

private:
  [[nodiscard]] bool at_end() const { return pos_ >= compact_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : compact_[pos_]; }
  [[nodiscard]] bool is_digit() const {
    return !at_end() && std::isdigit(static_cast<unsigned char>(compact_[pos_])) != 0;
  }
  [[nodiscard]] bool is_letter() const {
    return !at_end() && std::isalpha(static_cast<unsigned char>(compact_[pos_])) != 0;
  }
  [[nodiscard]] bool lookahead(std::string_view word) const {
    return compact_.compare(pos_, word.size(), word) == 0;
  }

  void set_error(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
      error_pos_ = pos_;
    }
  }

  ParseResult fail() const {
    const std::size_t column =
        error_pos_ < columns_.size() ? columns_[error_pos_] : original_.size();
    return ParseResult::failure(common::ErrorCode::InvalidNotation,
                                "invalid dice notation '" + std::string(original_) + "': " +
                                    error_ + " at position " + std::to_string(column));
  }

  // Reads a run of digits. nullopt with no error set means "no digits here".
  std::optional<std::int64_t> read_number() {
    if (!is_digit()) {
      return std::nullopt;
    }
    const std::size_t start = pos_;
    std::int64_t value = 0;
    while (is_digit()) {
      const int digit = compact_[pos_] - '0';
      if (value > (kMaxModifier - digit) / 10) {
        pos_ = start;
        set_error("number too large");
        return std::nullopt;
      }
      value = value * 10 + digit;
      ++pos_;
    }
    return value;
  }

  bool parse_repeat_prefix(DiceSpec &spec) {
    std::size_t scan = 0;
    while (scan < compact_.size() &&
           std::isdigit(static_cast<unsigned char>(compact_[scan])) != 0) {
      ++scan;
    }
    if (scan == 0 || scan >= compact_.size() || compact_[scan] != '#') {
      return true;
    }
    const auto repeat = read_number();
    if (!repeat.has_value()) {
      return false;
    }
    if (*repeat < 1) {
      pos_ = 0;
      set_error("repeat count must be at least 1");
      return false;
    }
    if (*repeat > kMaxRepeat) {
      pos_ = 0;
      set_error("repeat count exceeds " + std::to_string(kMaxRepeat));
      return false;
    }
    spec.repeat = static_cast<int>(*repeat);
    ++pos_; // '#'
    if (at_end()) {
      set_error("expected an expression after '#'");
      return false;
    }
    return true;
  }

  bool parse_term(DiceSpec &spec, const int sign) {
    const std::size_t term_start = pos_;
    const auto number = read_number();
    if (!error_.empty()) {
      return false;
    }

    if (peek() != 'd') {
      if (!number.has_value()) {
        set_error(at_end() ? "expected a term" : "expected a number or die");
        return false;
      }
      if (is_letter()) {
        set_error("unknown suffix");
        return false;
      }
      spec.terms.emplace_back(ModifierTerm{sign * *number});
      return true;
    }

    RollTerm term;
    term.sign = sign;
    if (number.has_value()) {
      if (*number < 1) {
        pos_ = term_start;
        set_error("dice count must be at least 1");
        return false;
      }
      if (*number > kMaxDiceCount) {
        pos_ = term_start;
        set_error("dice count exceeds " + std::to_string(kMaxDiceCount));
        return false;
      }
      term.count = static_cast<int>(*number);
    }
    ++pos_; // 'd'

    const std::size_t sides_start = pos_;
    const auto sides = read_number();
    if (!sides.has_value()) {
      set_error("expected die size");
      return false;
    }
    if (*sides < 2) {
      pos_ = sides_start;
      set_error("die must have at least 2 sides");
      return false;
    }
    if (*sides > kMaxSides) {
      pos_ = sides_start;
      set_error("die size exceeds " + std::to_string(kMaxSides));
      return false;
    }
    term.sides = static_cast<int>(*sides);

    if (peek() == 'k') {
      KeepClause keep;
      ++pos_;
      if (peek() == 'h') {
        ++pos_;
      } else if (peek() == 'l') {
        keep.mode = KeepMode::Lowest;
        ++pos_;
      }
      const std::size_t keep_start = pos_;
      const auto keep_count = read_number();
      if (!keep_count.has_value()) {
        set_error("expected keep count");
        return false;
      }
      if (*keep_count < 1) {
        pos_ = keep_start;
        set_error("keep count must be at least 1");
        return false;
      }
      if (*keep_count > term.count) {
        pos_ = keep_start;
        set_error("cannot keep " + std::to_string(*keep_count) + " of " +
                  std::to_string(term.count) + " dice");
        return false;
      }
      keep.count = static_cast<int>(*keep_count);
      term.keep = keep;
    }

    if (lookahead("adv") || lookahead("dis")) {
      const RollMode mode = lookahead("adv") ? RollMode::Advantage : RollMode::Disadvantage;
      if (spec.mode != RollMode::Normal) {
        set_error("only one advantage/disadvantage suffix is allowed");
        return false;
      }
      if (term.count != 1 || term.keep.has_value()) {
        set_error("advantage/disadvantage needs a single die without a keep clause");
        return false;
      }
      spec.mode = mode;
      spec.mode_term = spec.terms.size();
      pos_ += 3;
    }

    if (is_letter() || is_digit()) {
      set_error("unknown suffix");
      return false;
    }

    spec.terms.emplace_back(term);
    return true;
  }

  std::string_view original_;
  std::string compact_;
  std::vector<std::size_t> columns_;
  std::size_t pos_ = 0;
  std::string error_;
  std::size_t error_pos_ = 0;
};

} // namespace

std::string roll_mode_to_string(const RollMode mode) {
  switch (mode) {
  case RollMode::Normal:
    return "normal";
  case RollMode::Advantage:
    return "advantage";
  case RollMode::Disadvantage:
    return "disadvantage";
  }
  return "normal";
}

common::Result<DiceSpec> parse_notation(const std::string_view text) {
  NotationParser parser(text);
  return parser.parse();
}

std::string to_notation(const DiceSpec &spec) {
  std::string out;
  if (spec.repeat > 1) {
    out += std::to_string(spec.repeat) + "#";
  }
  for (std::size_t i = 0; i < spec.terms.size(); ++i) {
    const auto &term = spec.terms[i];
    if (const auto *roll = std::get_if<RollTerm>(&term)) {
      if (roll->sign < 0) {
        out += "-";
      } else if (i > 0) {
        out += "+";
      }
      out += std::to_string(roll->count) + "d" + std::to_string(roll->sides);
      if (roll->keep.has_value()) {
        out += roll->keep->mode == KeepMode::Highest ? "kh" : "kl";
        out += std::to_string(roll->keep->count);
      }
      if (spec.mode_term == i && spec.mode != RollMode::Normal) {
        out += spec.mode == RollMode::Advantage ? "adv" : "dis";
      }
    } else {
      const auto value = std::get<ModifierTerm>(term).value;
      if (value < 0) {
        out += "-" + std::to_string(-value);
      } else {
        if (i > 0) {
          out += "+";
        }
        out += std::to_string(value);
      }
    }
  }
  return out;
}

} // namespace talekeeper::dice
