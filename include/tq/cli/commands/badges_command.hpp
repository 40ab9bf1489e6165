#pragma once

#include <string>
#include <vector>

#include "tq/cli/application.hpp"
#include "tq/common.hpp"

namespace tq::cli {

class BadgesCommand : public Command {
public:
  explicit BadgesCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "badges"; }
  std::string description() const override { return "Show display badges for task text"; }

private:
  Application& app_;
  std::vector<std::string> words_;
};

}  // namespace tq::cli
