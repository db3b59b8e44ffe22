#pragma once

#include <chrono>
#include <string>

namespace pushid::util {

// Time utilities for RFC3339 formatting
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601), UTC with milliseconds
  static std::string toRfc3339(std::chrono::system_clock::time_point time);
};

}  // namespace pushid::util
