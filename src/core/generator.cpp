#include "pushid/core/generator.hpp"

#include <spdlog/spdlog.h>

#include "pushid/core/alphabet.hpp"

namespace pushid::core {

Generator::Generator()
    : Generator(std::make_shared<SystemClock>(), std::make_shared<MersenneTwisterSource>()) {}

Generator::Generator(std::shared_ptr<Clock> clock, std::shared_ptr<RandomSource> random)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      random_(random ? std::move(random) : std::make_shared<MersenneTwisterSource>()) {}

Result<PushId> Generator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generateLocked();
}

Result<std::vector<PushId>> Generator::generateBatch(std::size_t count) {
  std::vector<PushId> ids;
  ids.reserve(count);

  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < count; ++i) {
    auto id = generateLocked();
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    ids.push_back(std::move(*id));
  }

  return ids;
}

Generator& Generator::shared() {
  static Generator instance;
  return instance;
}

Result<PushId> Generator::generateLocked() {
  const std::int64_t now = clock_->nowMillis();
  const bool duplicate = last_time_.has_value() && *last_time_ == now;
  last_time_ = now;

  auto encoded = encodeTimestamp(now);
  if (!encoded.has_value()) {
    spdlog::error("Push ID generation failed: {}", encoded.error().message());
    return std::unexpected(encoded.error());
  }

  if (!duplicate) {
    for (auto& symbol : last_suffix_) {
      symbol = static_cast<std::uint8_t>(random_->nextSymbol() & kMaxSymbol);
    }
    spdlog::trace("Fresh suffix drawn for timestamp {}", now);
  } else {
    Suffix next = last_suffix_;
    if (!incrementSuffix(next)) {
      spdlog::warn("Suffix space exhausted within millisecond {}", now);
      return makeErrorResult<PushId>(ErrorCode::kSuffixExhausted,
                                     "No suffix left for timestamp " + std::to_string(now));
    }
    last_suffix_ = next;
    spdlog::trace("Duplicate timestamp {}, suffix incremented", now);
  }

  auto id = PushId::fromParts(*encoded, last_suffix_);
  if (!id.has_value()) {
    spdlog::error("Push ID generation failed: {}", id.error().message());
  }
  return id;
}

}  // namespace pushid::core
