#include "tq/cli/application.hpp"

#include <algorithm>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tq/util/logger.hpp"
#include "tq/util/time.hpp"

#include "tq/cli/commands/badges_command.hpp"
#include "tq/cli/commands/batch_command.hpp"
#include "tq/cli/commands/check_command.hpp"
#include "tq/cli/commands/config_command.hpp"
#include "tq/cli/commands/parse_command.hpp"

namespace tq::cli {

Application::Application()
    : app_("tq", "Quick-add task parser: turn one line of text into a structured task")
    , services_initialized_(false) {

  app_.set_version_flag("--version", tq::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);
  app_.fallthrough();  // Global flags may follow the subcommand

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (repeat for more)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress non-essential output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--now", global_options_.now,
                  "Reference time instead of the clock (YYYY-MM-DDTHH:MM[:SS])");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ParseCommand>(*this));
  registerCommand(std::make_unique<CheckCommand>(*this));
  registerCommand(std::make_unique<BadgesCommand>(*this));
  registerCommand(std::make_unique<BatchCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  tq parse "Call mom tomorrow at 5pm remind me 15 min before"
  tq parse --json "Buy milk #errands @Home ~30m"
  tq check "Team sync every monday at 9am"
  tq badges --now 2024-01-01T10:00 "Submit report every 2nd Tuesday"
  tq batch tasks.txt --json
  tq config set output.format json

For more information on a specific command, run:
  tq <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("{} failed ({}): {}", cmd_ptr->name(),
                    errorCodeToString(result.error().code()), result.error().message());
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

void Application::printError(const Error& error) const {
  if (jsonOutput()) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  const std::filesystem::path config_path = global_options_.config_file.empty()
                                                ? config::Config::defaultConfigPath()
                                                : std::filesystem::path(global_options_.config_file);

  std::string config_warning;
  config::Config loaded;
  auto load_result = loaded.load(config_path);
  if (load_result.has_value() || load_result.error().code() == ErrorCode::kFileNotFound) {
    config_ = std::move(loaded);
  } else {
    // A broken config file must not block parsing; fall back to defaults
    config_warning = load_result.error().message();
    config_ = config::Config{};
    config_.setPath(config_path);
  }

  auto level = util::Logger::parseLevel(config_.log_level).value_or(spdlog::level::warn);
  if (global_options_.verbose >= 3) {
    level = spdlog::level::trace;
  } else if (global_options_.verbose == 2) {
    level = std::min(level, spdlog::level::debug);
  } else if (global_options_.verbose == 1) {
    level = std::min(level, spdlog::level::info);
  }
  util::Logger::instance().initialize(level, config_.log_file);

  if (!config_warning.empty()) {
    spdlog::warn("Ignoring config file {}: {}", config_path.string(), config_warning);
  }
  spdlog::debug("Config loaded from {}", config_path.string());

  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

bool Application::jsonOutput() const {
  return global_options_.json || config_.output.format == config::Config::OutputFormat::kJson;
}

Result<DateTime> Application::referenceTime() const {
  if (global_options_.now.empty()) {
    return util::Time::now();
  }

  auto parsed = util::Time::fromIsoString(global_options_.now);
  if (!parsed.has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid --now value: " + global_options_.now));
  }
  return *parsed;
}

}  // namespace tq::cli
