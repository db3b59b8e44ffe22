#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pushid/common.hpp"
#include "pushid/config/config.hpp"
#include "pushid/core/generator.hpp"

namespace pushid::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress log output below errors
  std::string config_file;     // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();

  // Use the given generator instead of building one from config
  explicit Application(std::shared_ptr<core::Generator> generator);

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;
  config::Config& config();
  core::Generator& generator();

private:
  void setupGlobalOptions();
  void setupCommands();

  void registerCommand(std::unique_ptr<Command> command);

  // Load config, configure logging and build the generator
  Result<void> initializeServices();

  void reportError(const Error& error) const;

  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  std::shared_ptr<core::Generator> generator_;
  bool services_initialized_ = false;

  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace pushid::cli
