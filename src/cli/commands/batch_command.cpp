#include "tq/cli/commands/batch_command.hpp"

#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tq/cli/task_output.hpp"
#include "tq/parser/task_parser.hpp"
#include "tq/util/filesystem.hpp"

namespace tq::cli {

BatchCommand::BatchCommand(Application& app) : app_(app) {}

void BatchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", input_file_, "Input file, one task per line (default: stdin)");
}

Result<std::string> BatchCommand::readInput() const {
  if (!input_file_.empty() && input_file_ != "-") {
    return util::FileSystem::readFile(input_file_);
  }

  std::ostringstream content;
  content << std::cin.rdbuf();
  if (std::cin.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Failed to read stdin"));
  }
  return content.str();
}

Result<int> BatchCommand::execute(const GlobalOptions& /*options*/) {
  auto now = app_.referenceTime();
  if (!now.has_value()) {
    return std::unexpected(now.error());
  }

  auto content = readInput();
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  const bool json = app_.jsonOutput();
  std::istringstream lines(*content);
  std::string line;
  int parsed_count = 0;

  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }

    const auto task = parser::TaskParser::parse(line, *now);
    if (json) {
      std::cout << core::toJson(task).dump() << "\n";
    } else {
      std::cout << summarizeTask(task) << "\n";
    }
    ++parsed_count;
  }

  spdlog::debug("batch: parsed {} task(s)", parsed_count);
  return 0;
}

}  // namespace tq::cli
