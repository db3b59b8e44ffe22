#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "pushid/common.hpp"
#include "pushid/core/clock.hpp"
#include "pushid/core/push_id.hpp"
#include "pushid/core/random_source.hpp"

namespace pushid::core {

/**
 * @brief Generates push IDs that sort in generation order.
 *
 * Holds the timestamp of the previous call and the suffix produced by it.
 * A call in a new millisecond draws 12 fresh symbols; a call in the same
 * millisecond reuses the previous suffix incremented by one, so IDs from a
 * single generator never go backwards while the clock doesn't.
 *
 * All calls are serialized on an internal mutex. The clock and random source
 * are only used under that lock.
 */
class Generator {
 public:
  // System clock and an entropy-seeded Mersenne Twister
  Generator();

  Generator(std::shared_ptr<Clock> clock, std::shared_ptr<RandomSource> random);

  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;

  /**
   * @brief Generate the next push ID
   * @return The ID, or one of:
   *   - kTimestampOverflow: the clock value does not fit in 48 bits
   *   - kSuffixExhausted: same millisecond and the previous suffix is all 63s
   *   - kLengthInvariant: assembled ID is not 20 characters
   */
  Result<PushId> generate();

  /**
   * @brief Generate several IDs under a single lock acquisition
   *
   * Either all IDs are returned or the first error is.
   */
  Result<std::vector<PushId>> generateBatch(std::size_t count);

  // Process-wide instance
  static Generator& shared();

 private:
  Result<PushId> generateLocked();

  std::shared_ptr<Clock> clock_;
  std::shared_ptr<RandomSource> random_;

  std::mutex mutex_;
  std::optional<std::int64_t> last_time_;
  Suffix last_suffix_{};
};

}  // namespace pushid::core
