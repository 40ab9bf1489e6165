#pragma once

#include <string>
#include <vector>

#include "tq/cli/application.hpp"
#include "tq/common.hpp"

namespace tq::cli {

/**
 * Parse one line of task text and print the extracted fields
 *
 * Usage: tq parse <text...>
 * With --json the result is the task's JSON object plus "folder_match"
 * when the folder resolves against the configured folders.
 */
class ParseCommand : public Command {
public:
  explicit ParseCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "parse"; }
  std::string description() const override { return "Parse task text into structured fields"; }

private:
  Application& app_;
  std::vector<std::string> words_;
  bool no_badges_ = false;
};

}  // namespace tq::cli
