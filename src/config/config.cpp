#include "pushid/config/config.hpp"

#include <cstdlib>
#include <fstream>

#include <toml++/toml.hpp>

namespace pushid::config {

Config::Config() {
  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    // If loading fails, silently continue with defaults
    (void)result;
  }
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  // Parse into a copy so a bad file leaves the current values intact
  Config parsed = *this;

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        parsed.logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        parsed.logging.file = *value;
      }
    }

    if (auto output_table = config_data["output"].as_table()) {
      if (auto value = (*output_table)["format"].value<std::string>()) {
        auto format = stringToOutputFormat(*value);
        if (!format) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "Unknown output format: " + *value));
        }
        parsed.output_format = *format;
      }
    }

    if (auto generate_table = config_data["generate"].as_table()) {
      if (auto value = (*generate_table)["count"].value<int64_t>()) {
        parsed.generate.count = static_cast<int>(*value);
      }
      if (auto value = (*generate_table)["seed"].value<int64_t>()) {
        if (*value < 0) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "generate.seed must not be negative"));
        }
        parsed.generate.seed = static_cast<std::uint64_t>(*value);
      }
    }

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }

  auto valid = parsed.validate();
  if (!valid.has_value()) {
    return valid;
  }

  parsed.config_path_ = config_path;
  *this = std::move(parsed);
  return {};
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;

  auto logging_table = toml::table{};
  logging_table.insert_or_assign("level", logging.level);
  if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file);
  config_data.insert_or_assign("logging", std::move(logging_table));

  auto output_table = toml::table{};
  output_table.insert_or_assign("format", outputFormatToString(output_format));
  config_data.insert_or_assign("output", std::move(output_table));

  auto generate_table = toml::table{};
  generate_table.insert_or_assign("count", static_cast<int64_t>(generate.count));
  if (generate.seed) {
    generate_table.insert_or_assign("seed", static_cast<int64_t>(*generate.seed));
  }
  config_data.insert_or_assign("generate", std::move(generate_table));

  std::error_code ec;
  if (save_path.has_parent_path()) {
    std::filesystem::create_directories(save_path.parent_path(), ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create config directory: " + ec.message()));
    }
  }

  std::ofstream file(save_path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot write config file: " + save_path.string()));
  }
  file << config_data << "\n";
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed writing config file: " + save_path.string()));
  }

  return {};
}

Result<void> Config::validate() const {
  if (!util::parseLogLevel(logging.level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown log level: " + logging.level));
  }
  if (generate.count < 1 || generate.count > kMaxGenerateCount) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "generate.count must be between 1 and " +
                                     std::to_string(kMaxGenerateCount)));
  }
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "pushid" / "config.toml";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "pushid" / "config.toml";
  }
  return std::filesystem::path("pushid.toml");
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText: return "text";
    case OutputFormat::kJson: return "json";
  }
  return "text";
}

std::optional<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::nullopt;
}

}  // namespace pushid::config
