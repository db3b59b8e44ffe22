#include "pushid/cli/commands/inspect_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "pushid/core/push_id.hpp"
#include "pushid/util/time.hpp"

namespace pushid::cli {

void InspectCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ids", ids_, "Push IDs to decode")->required();
}

Result<int> InspectCommand::execute(const GlobalOptions& options) {
  // Parse everything first so invalid input produces no partial output
  std::vector<core::PushId> parsed;
  parsed.reserve(ids_.size());
  for (const auto& raw : ids_) {
    auto id = core::PushId::fromString(raw);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    parsed.push_back(std::move(*id));
  }

  if (options.json) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& id : parsed) {
      nlohmann::json entry;
      entry["id"] = id.toString();
      entry["timestamp_ms"] = id.timestampMillis();
      entry["time"] = util::Time::toRfc3339(id.timestamp());
      entry["suffix"] = id.suffix();
      result.push_back(std::move(entry));
    }
    std::cout << result.dump(2) << std::endl;
    return 0;
  }

  for (const auto& id : parsed) {
    std::cout << id.toString() << "\n";
    std::cout << "  timestamp: " << id.timestampMillis()
              << " (" << util::Time::toRfc3339(id.timestamp()) << ")\n";
    std::cout << "  suffix:   ";
    for (auto symbol : id.suffix()) {
      std::cout << " " << static_cast<int>(symbol);
    }
    std::cout << "\n";
  }
  std::cout.flush();

  return 0;
}

} // namespace pushid::cli
