#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "pushid/cli/application.hpp"

namespace pushid::cli {

/**
 * @brief Print freshly generated push IDs
 * Usage: pushid generate [--count N]
 */
class GenerateCommand : public Command {
public:
  explicit GenerateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "generate"; }
  std::string description() const override { return "Generate push IDs"; }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  int count_ = 0;  // 0: take the configured default
};

} // namespace pushid::cli
