#include "tq/cli/commands/check_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tq/parser/task_parser.hpp"

namespace tq::cli {

CheckCommand::CheckCommand(Application& app) : app_(app) {}

void CheckCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", words_, "Task text")->required();
}

Result<int> CheckCommand::execute(const GlobalOptions& options) {
  std::string text;
  for (const auto& word : words_) {
    if (!text.empty()) text += ' ';
    text += word;
  }

  const bool parseable = parser::TaskParser::looksParseable(text);

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["parseable"] = parseable;
    std::cout << output.dump() << "\n";
  } else if (!options.quiet) {
    std::cout << (parseable ? "yes" : "no") << "\n";
  }

  return parseable ? 0 : 1;
}

}  // namespace tq::cli
