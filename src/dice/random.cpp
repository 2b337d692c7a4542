#include "talekeeper/dice/random.hpp"

#include "talekeeper/common/fs.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <string>

namespace talekeeper::dice {

namespace {

void check_range(const int low, const int high) {
  if (low > high) {
    throw std::invalid_argument("next_uniform_int: low " + std::to_string(low) +
                                " is greater than high " + std::to_string(high));
  }
}

} // namespace

SeededRandomSource::SeededRandomSource(const std::uint64_t seed) : seed_(seed), engine_(seed) {}

int SeededRandomSource::next_uniform_int(const int low, const int high) {
  check_range(low, high);
  std::uniform_int_distribution<int> dist(low, high);
  return dist(engine_);
}

std::uint64_t CryptoRandomSource::next_u64() {
  std::uint64_t value = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char *>(&value), sizeof(value)) != 1) {
    char buffer[256] = {0};
    ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + buffer);
  }
  return value;
}

int CryptoRandomSource::next_uniform_int(const int low, const int high) {
  check_range(low, high);
  const std::uint64_t range =
      static_cast<std::uint64_t>(static_cast<std::int64_t>(high) - static_cast<std::int64_t>(low)) +
      1;
  // 2^64 mod range: draws below this would bias the low residues.
  const std::uint64_t threshold = (0 - range) % range;
  std::uint64_t draw = 0;
  do {
    draw = next_u64();
  } while (draw < threshold);
  return static_cast<int>(static_cast<std::int64_t>(low) +
                          static_cast<std::int64_t>(draw % range));
}

common::Result<std::unique_ptr<RandomSource>>
make_random_source(const config::DiceConfig &config) {
  using R = common::Result<std::unique_ptr<RandomSource>>;
  const std::string kind = common::to_lower(common::trim(config.rng));
  if (kind.empty() || kind == "crypto") {
    return R::success(std::make_unique<CryptoRandomSource>());
  }
  if (kind == "seeded") {
    const std::uint64_t seed =
        config.seed.has_value() ? *config.seed : CryptoRandomSource::next_u64();
    return R::success(std::make_unique<SeededRandomSource>(seed));
  }
  return R::failure(common::ErrorCode::ConfigError, "unknown dice.rng: " + config.rng);
}

} // namespace talekeeper::dice
