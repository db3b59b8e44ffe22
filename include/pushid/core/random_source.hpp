#pragma once

#include <cstdint>
#include <random>

namespace pushid::core {

// Source of suffix symbols. Not required to be thread-safe: the generator
// only calls it while holding its lock.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniformly distributed value in [0, 64)
  virtual std::uint8_t nextSymbol() = 0;
};

// 64-bit Mersenne Twister. Collision avoidance only, not suitable for secrets.
class MersenneTwisterSource : public RandomSource {
 public:
  // Seed from std::random_device
  MersenneTwisterSource();

  // Fixed seed for reproducible sequences
  explicit MersenneTwisterSource(std::uint64_t seed);

  std::uint8_t nextSymbol() override;

 private:
  std::mt19937_64 engine_;
  std::uniform_int_distribution<int> distribution_;
};

}  // namespace pushid::core
