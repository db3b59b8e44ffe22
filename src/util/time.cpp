#include "pushid/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pushid::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

}  // namespace pushid::util
