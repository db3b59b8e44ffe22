#pragma once

#include <optional>
#include <string>

#include <spdlog/common.h>

#include "pushid/common.hpp"

namespace pushid::util {

struct LoggingOptions {
  std::string level = "warn";   // trace|debug|info|warn|error|critical|off
  std::string file;             // Rotating log file, empty for console only
};

// Parse a level name; nullopt for unknown names
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Install the "pushid" logger as spdlog's default logger.
// Safe to call more than once; later calls replace the previous logger.
Result<void> initializeLogging(const LoggingOptions& options);

}  // namespace pushid::util
