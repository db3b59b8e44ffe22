#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "pushid/common.hpp"
#include "pushid/util/logging.hpp"

namespace pushid::config {

// Upper bound on IDs printed by one `pushid generate`
inline constexpr int kMaxGenerateCount = 100000;

// Configuration for the pushid tool
class Config {
 public:
  // Defaults, overlaid with the default config file when it exists
  Config();

  // Logging
  util::LoggingOptions logging;

  // Output format
  enum class OutputFormat {
    kText,
    kJson
  };
  OutputFormat output_format = OutputFormat::kText;

  // Generation defaults
  struct GenerateConfig {
    int count = 1;                      // IDs printed by `pushid generate`
    std::optional<std::uint64_t> seed;  // Fixed random seed, entropy if unset
  };
  GenerateConfig generate;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (config_path empty: path last loaded, else default)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Check value ranges and enumerations
  Result<void> validate() const;

  // Path of the file last loaded, empty if none
  const std::filesystem::path& configPath() const { return config_path_; }

  // $XDG_CONFIG_HOME/pushid/config.toml, or ~/.config/pushid/config.toml
  static std::filesystem::path defaultConfigPath();

  static std::string outputFormatToString(OutputFormat format);
  static std::optional<OutputFormat> stringToOutputFormat(const std::string& str);

 private:
  std::filesystem::path config_path_;
};

}  // namespace pushid::config
