#include "tq/cli/commands/config_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

namespace tq::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& /*options*/) {
  if (get_mode_) {
    return executeGet();
  } else if (set_mode_) {
    return executeSet();
  } else if (list_mode_) {
    return executeList();
  } else if (path_mode_) {
    return executePath();
  } else if (validate_mode_) {
    return executeValidate();
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet() {
  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *result;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *result << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet() {
  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(makeError(save_result.error().code(),
                                     "Failed to save configuration: " +
                                         save_result.error().message()));
  }

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else if (!app_.globalOptions().quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeList() {
  const auto entries = app_.config().list();

  if (app_.jsonOutput()) {
    nlohmann::json output = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
      output[key] = value;
    }
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  for (const auto& [key, value] : entries) {
    std::cout << std::left << std::setw(16) << key << " = " << value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath() {
  const auto path = app_.config().path().empty() ? config::Config::defaultConfigPath()
                                                 : app_.config().path();

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["path"] = path.string();
    output["exists"] = std::filesystem::exists(path);
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << path.string() << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate() {
  auto result = app_.config().validate();
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["valid"] = true;
    std::cout << output.dump(2) << "\n";
  } else if (!app_.globalOptions().quiet) {
    std::cout << "Configuration is valid\n";
  }
  return 0;
}

}  // namespace tq::cli
