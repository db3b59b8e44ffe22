#include "pushid/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "pushid/cli/commands/generate_command.hpp"
#include "pushid/cli/commands/inspect_command.hpp"
#include "pushid/util/logging.hpp"

namespace pushid::cli {

Application::Application()
    : app_("pushid", "Generate and inspect sortable push IDs") {
  app_.set_version_flag("--version", pushid::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
}

Application::Application(std::shared_ptr<core::Generator> generator)
    : Application() {
  generator_ = std::move(generator);
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

core::Generator& Application::generator() {
  if (!generator_) {
    // Process-wide instance, not owned
    generator_ = std::shared_ptr<core::Generator>(&core::Generator::shared(),
                                                  [](core::Generator*) {});
  }
  return *generator_;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (-vv for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<GenerateCommand>(*this));
  registerCommand(std::make_unique<InspectCommand>());
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (!global_options_.config_file.empty()) {
    auto loaded = config_.load(global_options_.config_file);
    if (!loaded.has_value()) {
      return loaded;
    }
  }

  auto logging = config_.logging;
  if (global_options_.quiet) {
    logging.level = "error";
  } else if (global_options_.verbose >= 2) {
    logging.level = "trace";
  } else if (global_options_.verbose == 1) {
    logging.level = "debug";
  }

  auto logging_result = util::initializeLogging(logging);
  if (!logging_result.has_value()) {
    return logging_result;
  }

  if (config_.output_format == config::Config::OutputFormat::kJson) {
    global_options_.json = true;
  }

  if (!generator_ && config_.generate.seed) {
    spdlog::debug("Using fixed random seed {}", *config_.generate.seed);
    generator_ = std::make_shared<core::Generator>(
        std::make_shared<core::SystemClock>(),
        std::make_shared<core::MersenneTwisterSource>(*config_.generate.seed));
  }

  if (!config_.configPath().empty()) {
    spdlog::debug("Loaded config from {}", config_.configPath().string());
  }

  services_initialized_ = true;
  return {};
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

}  // namespace pushid::cli
