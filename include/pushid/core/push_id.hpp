#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "pushid/common.hpp"

namespace pushid::core {

inline constexpr std::size_t kPushIdLength = 20;
inline constexpr std::size_t kTimestampLength = 8;
inline constexpr std::size_t kSuffixLength = 12;

// 72 random bits as 12 base64 digits, index 0 most significant
using Suffix = std::array<std::uint8_t, kSuffixLength>;

// Encode milliseconds since the epoch as 8 alphabet symbols, most significant
// first. Fails with kTimestampOverflow if the value needs more than 48 bits.
Result<std::string> encodeTimestamp(std::int64_t milliseconds);

// Inverse of encodeTimestamp
Result<std::int64_t> decodeTimestamp(std::string_view encoded);

// Add one to the suffix as a base64 number, carrying leftward.
// Returns false and leaves the suffix untouched if every digit is already 63.
bool incrementSuffix(Suffix& suffix) noexcept;

// Push ID: 20 characters, 8 timestamp symbols followed by 12 suffix symbols.
// Sorts lexicographically in generation order.
class PushId {
 public:
  // Parse push ID from string
  static Result<PushId> fromString(std::string_view str);

  // Assemble from an already encoded timestamp and a suffix
  static Result<PushId> fromParts(std::string_view encoded_timestamp, const Suffix& suffix);

  // Default constructor creates invalid ID
  PushId() = default;

  const std::string& toString() const { return id_; }

  // Timestamp component
  std::int64_t timestampMillis() const;
  std::chrono::system_clock::time_point timestamp() const;

  // Random component
  Suffix suffix() const;

  bool operator==(const PushId& other) const noexcept;
  bool operator!=(const PushId& other) const noexcept;
  bool operator<(const PushId& other) const noexcept;
  bool operator<=(const PushId& other) const noexcept;
  bool operator>(const PushId& other) const noexcept;
  bool operator>=(const PushId& other) const noexcept;

  bool isValid() const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const PushId& id) const noexcept;
  };

 private:
  explicit PushId(std::string id);

  static bool isValidFormat(std::string_view str) noexcept;

  std::string id_;
};

}  // namespace pushid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<pushid::core::PushId> : pushid::core::PushId::Hash {};
}  // namespace std
