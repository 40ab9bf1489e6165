#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tq/common.hpp"
#include "tq/config/config.hpp"

namespace tq::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Raise log level (repeatable: -v, -vv, -vvv)
  bool quiet = false;          // --quiet: Suppress non-essential output
  std::string config_file;     // --config: Path to config file
  std::string now;             // --now: Fixed reference instant (YYYY-MM-DDTHH:MM[:SS])
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* /*cmd*/) {}
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;
  config::Config& config();

  // --json, or output.format = "json" in the config file
  bool jsonOutput() const;

  // --now when given, otherwise the current local time
  Result<DateTime> referenceTime() const;

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);
  void printError(const Error& error) const;

  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  bool services_initialized_;

  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace tq::cli
