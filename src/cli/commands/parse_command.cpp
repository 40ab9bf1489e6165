#include "tq/cli/commands/parse_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "tq/cli/task_output.hpp"
#include "tq/parser/result_formatter.hpp"
#include "tq/parser/task_parser.hpp"

namespace tq::cli {

namespace {

std::string joinWords(const std::vector<std::string>& words) {
  std::string text;
  for (const auto& word : words) {
    if (!text.empty()) text += ' ';
    text += word;
  }
  return text;
}

}  // namespace

ParseCommand::ParseCommand(Application& app) : app_(app) {}

void ParseCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", words_, "Task text (quote it or pass it as several words)")->required();
  cmd->add_flag("--no-badges", no_badges_, "Do not print display badges");
}

Result<int> ParseCommand::execute(const GlobalOptions& options) {
  auto now = app_.referenceTime();
  if (!now.has_value()) {
    return std::unexpected(now.error());
  }

  const auto task = parser::TaskParser::parse(joinWords(words_), *now);

  std::optional<std::string> folder_match;
  if (task.folder_name) {
    auto resolved = core::resolveFolder(*task.folder_name, app_.config().folders);
    if (resolved.has_value()) {
      folder_match = *resolved;
    }
  }

  if (app_.jsonOutput()) {
    nlohmann::json output = core::toJson(task);
    if (folder_match) {
      output["folder_match"] = *folder_match;
    }
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  for (const auto& [label, value] : describeTask(task)) {
    std::cout << std::left << std::setw(17) << (label + ":") << value << "\n";
  }
  if (folder_match) {
    std::cout << std::left << std::setw(17) << "folder_match:" << *folder_match << "\n";
  }

  if (app_.config().output.badges && !no_badges_ && !options.quiet) {
    auto badges = parser::ResultFormatter::formatForDisplay(task, *now);
    if (!badges.empty()) {
      std::cout << "\n";
      for (const auto& badge : badges) {
        std::cout << "  " << badge << "\n";
      }
    }
  }

  return 0;
}

}  // namespace tq::cli
