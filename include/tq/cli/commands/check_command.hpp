#pragma once

#include <string>
#include <vector>

#include "tq/cli/application.hpp"
#include "tq/common.hpp"

namespace tq::cli {

// Exit status 0 when the text looks parseable, 1 otherwise
class CheckCommand : public Command {
public:
  explicit CheckCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "check"; }
  std::string description() const override {
    return "Check whether text contains anything parseable";
  }

private:
  Application& app_;
  std::vector<std::string> words_;
};

}  // namespace tq::cli
