#include "pushid/cli/commands/generate_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pushid::cli {

GenerateCommand::GenerateCommand(Application& app) : app_(app) {
}

void GenerateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("-n,--count", count_, "Number of IDs to generate")
     ->check(CLI::Range(1, config::kMaxGenerateCount));
}

Result<int> GenerateCommand::execute(const GlobalOptions& options) {
  const int count = count_ > 0 ? count_ : app_.config().generate.count;
  spdlog::debug("Generating {} push ID(s)", count);

  auto ids = app_.generator().generateBatch(static_cast<std::size_t>(count));
  if (!ids.has_value()) {
    return std::unexpected(ids.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["ids"] = nlohmann::json::array();
    for (const auto& id : *ids) {
      result["ids"].push_back(id.toString());
    }
    result["count"] = ids->size();
    std::cout << result.dump(2) << std::endl;
  } else {
    for (const auto& id : *ids) {
      std::cout << id.toString() << "\n";
    }
    std::cout.flush();
  }

  return 0;
}

} // namespace pushid::cli
