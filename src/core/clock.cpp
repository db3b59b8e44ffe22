#include "pushid/core/clock.hpp"

#include <chrono>

namespace pushid::core {

std::int64_t SystemClock::nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace pushid::core
