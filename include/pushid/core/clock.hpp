#pragma once

#include <cstdint>

namespace pushid::core {

// Source of the current time in milliseconds since the Unix epoch (UTC)
class Clock {
 public:
  virtual ~Clock() = default;

  virtual std::int64_t nowMillis() = 0;
};

// Wall clock backed by std::chrono::system_clock
class SystemClock : public Clock {
 public:
  std::int64_t nowMillis() override;
};

}  // namespace pushid::core
