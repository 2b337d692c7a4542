#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/config/schema.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string_view>

namespace talekeeper::dice {

class RandomSource {
public:
  virtual ~RandomSource() = default;

  /// Uniform integer in [low, high], both inclusive.
  [[nodiscard]] virtual int next_uniform_int(int low, int high) = 0;
  [[nodiscard]] virtual std::optional<std::uint64_t> seed() const { return std::nullopt; }
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Reproducible source for tests and replays.
class SeededRandomSource final : public RandomSource {
public:
  explicit SeededRandomSource(std::uint64_t seed);

  [[nodiscard]] int next_uniform_int(int low, int high) override;
  [[nodiscard]] std::optional<std::uint64_t> seed() const override { return seed_; }
  [[nodiscard]] std::string_view name() const override { return "seeded"; }

private:
  std::uint64_t seed_;
  std::mt19937_64 engine_;
};

/// OpenSSL-backed source for live play. Throws std::runtime_error if RAND_bytes fails.
class CryptoRandomSource final : public RandomSource {
public:
  [[nodiscard]] int next_uniform_int(int low, int high) override;
  [[nodiscard]] std::string_view name() const override { return "crypto"; }

  [[nodiscard]] static std::uint64_t next_u64();
};

/// "crypto" or "seeded"; a seeded source without a configured seed draws one from OpenSSL.
[[nodiscard]] common::Result<std::unique_ptr<RandomSource>>
make_random_source(const config::DiceConfig &config);

} // namespace talekeeper::dice
