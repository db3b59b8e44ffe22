#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pushid::core {

// Modified base64 alphabet ordered by ASCII, so that symbol order and
// byte-wise string order agree. Must not change: existing keys depend on it.
inline constexpr std::string_view kAlphabet =
    "-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";
inline constexpr std::size_t kAlphabetSize = 64;
inline constexpr std::uint8_t kMaxSymbol = kAlphabetSize - 1;

static_assert(kAlphabet.size() == kAlphabetSize, "alphabet must have 64 symbols");

// Character for a symbol index in [0, 64)
char symbolAt(std::uint8_t index);

// Symbol index of a character, or -1 if it is not part of the alphabet
int indexOf(char c) noexcept;

bool isAlphabetSymbol(char c) noexcept;

}  // namespace pushid::core
