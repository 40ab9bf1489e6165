#pragma once

#include <istream>
#include <string>

#include "tq/cli/application.hpp"
#include "tq/common.hpp"

namespace tq::cli {

/**
 * Parse every non-empty line of a file, or stdin, as its own task
 *
 * All lines share one reference instant. Output is one line per task, or
 * JSON Lines with --json.
 */
class BatchCommand : public Command {
public:
  explicit BatchCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "batch"; }
  std::string description() const override { return "Parse one task per input line"; }

private:
  Application& app_;
  std::string input_file_;

  Result<std::string> readInput() const;
};

}  // namespace tq::cli
