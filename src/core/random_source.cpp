#include "pushid/core/random_source.hpp"

#include "pushid/core/alphabet.hpp"

namespace pushid::core {

namespace {

std::uint64_t entropySeed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

}  // namespace

MersenneTwisterSource::MersenneTwisterSource()
    : MersenneTwisterSource(entropySeed()) {}

MersenneTwisterSource::MersenneTwisterSource(std::uint64_t seed)
    : engine_(seed), distribution_(0, kMaxSymbol) {}

std::uint8_t MersenneTwisterSource::nextSymbol() {
  return static_cast<std::uint8_t>(distribution_(engine_));
}

}  // namespace pushid::core
