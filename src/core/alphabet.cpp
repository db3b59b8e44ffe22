#include "pushid/core/alphabet.hpp"

#include <array>

namespace pushid::core {

namespace {

constexpr std::array<int, 256> buildReverseTable() {
  std::array<int, 256> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < kAlphabetSize; ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  return table;
}

constexpr auto kReverse = buildReverseTable();

// Ordinal position must match sort position
constexpr bool isStrictlyAscending() {
  for (std::size_t i = 1; i < kAlphabetSize; ++i) {
    if (static_cast<unsigned char>(kAlphabet[i - 1]) >= static_cast<unsigned char>(kAlphabet[i])) {
      return false;
    }
  }
  return true;
}

static_assert(isStrictlyAscending(), "alphabet must be sorted by byte value");

}  // namespace

char symbolAt(std::uint8_t index) {
  return kAlphabet[index & kMaxSymbol];
}

int indexOf(char c) noexcept {
  return kReverse[static_cast<unsigned char>(c)];
}

bool isAlphabetSymbol(char c) noexcept {
  return indexOf(c) >= 0;
}

}  // namespace pushid::core
