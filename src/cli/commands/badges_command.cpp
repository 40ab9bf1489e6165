#include "tq/cli/commands/badges_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tq/parser/result_formatter.hpp"
#include "tq/parser/task_parser.hpp"

namespace tq::cli {

BadgesCommand::BadgesCommand(Application& app) : app_(app) {}

void BadgesCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", words_, "Task text")->required();
}

Result<int> BadgesCommand::execute(const GlobalOptions& /*options*/) {
  auto now = app_.referenceTime();
  if (!now.has_value()) {
    return std::unexpected(now.error());
  }

  std::string text;
  for (const auto& word : words_) {
    if (!text.empty()) text += ' ';
    text += word;
  }

  const auto task = parser::TaskParser::parse(text, *now);
  const auto badges = parser::ResultFormatter::formatForDisplay(task, *now);

  if (app_.jsonOutput()) {
    nlohmann::json output = badges;
    std::cout << output.dump() << "\n";
    return 0;
  }

  for (const auto& badge : badges) {
    std::cout << badge << "\n";
  }
  return 0;
}

}  // namespace tq::cli
