#include "pushid/core/push_id.hpp"

#include "pushid/core/alphabet.hpp"

namespace pushid::core {

Result<std::string> encodeTimestamp(std::int64_t milliseconds) {
  if (milliseconds < 0) {
    return makeErrorResult<std::string>(ErrorCode::kTimestampOverflow,
                                        "Timestamp precedes the epoch: " + std::to_string(milliseconds));
  }

  std::string result(kTimestampLength, kAlphabet[0]);
  auto remaining = static_cast<std::uint64_t>(milliseconds);

  for (int i = kTimestampLength - 1; i >= 0; --i) {
    result[i] = symbolAt(static_cast<std::uint8_t>(remaining % kAlphabetSize));
    remaining /= kAlphabetSize;
  }

  if (remaining != 0) {
    return makeErrorResult<std::string>(ErrorCode::kTimestampOverflow,
                                        "Timestamp does not fit in 8 symbols: " + std::to_string(milliseconds));
  }

  return result;
}

Result<std::int64_t> decodeTimestamp(std::string_view encoded) {
  if (encoded.length() != kTimestampLength) {
    return makeErrorResult<std::int64_t>(ErrorCode::kInvalidArgument,
                                         "Encoded timestamp must be 8 symbols: " + std::string(encoded));
  }

  std::int64_t result = 0;
  for (char c : encoded) {
    int value = indexOf(c);
    if (value < 0) {
      return makeErrorResult<std::int64_t>(ErrorCode::kInvalidArgument,
                                           "Invalid symbol in timestamp: " + std::string(encoded));
    }
    result = result * static_cast<std::int64_t>(kAlphabetSize) + value;
  }

  return result;
}

bool incrementSuffix(Suffix& suffix) noexcept {
  int i = kSuffixLength - 1;
  while (i >= 0 && suffix[i] == kMaxSymbol) {
    --i;
  }
  if (i < 0) {
    return false;
  }

  for (int j = kSuffixLength - 1; j > i; --j) {
    suffix[j] = 0;
  }
  ++suffix[i];
  return true;
}

Result<PushId> PushId::fromString(std::string_view str) {
  if (!isValidFormat(str)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid push ID format: " + std::string(str)));
  }

  return PushId(std::string(str));
}

Result<PushId> PushId::fromParts(std::string_view encoded_timestamp, const Suffix& suffix) {
  std::string id(encoded_timestamp);
  id.reserve(kPushIdLength);
  for (auto symbol : suffix) {
    id += symbolAt(symbol);
  }

  if (id.length() != kPushIdLength) {
    return std::unexpected(makeError(ErrorCode::kLengthInvariant,
                                     "Push ID length should be 20, got " + std::to_string(id.length())));
  }

  return PushId(std::move(id));
}

std::int64_t PushId::timestampMillis() const {
  if (!isValid()) {
    return 0;
  }

  auto decoded = decodeTimestamp(std::string_view(id_).substr(0, kTimestampLength));
  return decoded.value_or(0);
}

std::chrono::system_clock::time_point PushId::timestamp() const {
  return std::chrono::system_clock::time_point{
      std::chrono::milliseconds(timestampMillis())
  };
}

Suffix PushId::suffix() const {
  Suffix result{};
  if (!isValid()) {
    return result;
  }

  for (std::size_t i = 0; i < kSuffixLength; ++i) {
    result[i] = static_cast<std::uint8_t>(indexOf(id_[kTimestampLength + i]));
  }
  return result;
}

bool PushId::operator==(const PushId& other) const noexcept {
  return id_ == other.id_;
}

bool PushId::operator!=(const PushId& other) const noexcept {
  return !(*this == other);
}

bool PushId::operator<(const PushId& other) const noexcept {
  return id_ < other.id_;
}

bool PushId::operator<=(const PushId& other) const noexcept {
  return id_ <= other.id_;
}

bool PushId::operator>(const PushId& other) const noexcept {
  return id_ > other.id_;
}

bool PushId::operator>=(const PushId& other) const noexcept {
  return id_ >= other.id_;
}

bool PushId::isValid() const noexcept {
  return !id_.empty() && isValidFormat(id_);
}

std::size_t PushId::Hash::operator()(const PushId& id) const noexcept {
  return std::hash<std::string>{}(id.id_);
}

PushId::PushId(std::string id) : id_(std::move(id)) {}

bool PushId::isValidFormat(std::string_view str) noexcept {
  if (str.length() != kPushIdLength) {
    return false;
  }

  for (char c : str) {
    if (!isAlphabetSymbol(c)) {
      return false;
    }
  }

  return true;
}

}  // namespace pushid::core
