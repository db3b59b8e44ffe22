#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "pushid/cli/application.hpp"

namespace pushid::cli {

/**
 * @brief Decode the timestamp and suffix of existing push IDs
 * Usage: pushid inspect [--] <id>...
 *
 * Most current IDs start with '-', so pass them after "--".
 */
class InspectCommand : public Command {
public:
  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "inspect"; }
  std::string description() const override { return "Decode push IDs"; }

  void setupCommand(CLI::App* cmd) override;

private:
  std::vector<std::string> ids_;
};

} // namespace pushid::cli
