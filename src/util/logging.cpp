#include "pushid/util/logging.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pushid::util {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return std::nullopt;
}

Result<void> initializeLogging(const LoggingOptions& options) {
  auto level = parseLogLevel(options.level);
  if (!level) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown log level: " + options.level));
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  std::string file_error;
  if (!options.file.empty()) {
    try {
      auto parent = std::filesystem::path(options.file).parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file, kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
      // Fall back to console-only logging
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("pushid", sinks.begin(), sinks.end());
  logger->set_pattern(kLogPattern);
  logger->set_level(*level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }

  return {};
}

}  // namespace pushid::util
