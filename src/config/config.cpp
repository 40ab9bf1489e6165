#include "tq/config/config.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include <toml++/toml.hpp>

#include "tq/util/filesystem.hpp"
#include "tq/util/xdg.hpp"

namespace tq::config {

namespace {

constexpr std::array<const char*, 6> kLogLevels = {"trace", "debug", "info",
                                                   "warn",  "error", "off"};

std::string joinFolders(const std::vector<std::string>& folders) {
  std::string joined;
  for (const auto& folder : folders) {
    if (!joined.empty()) joined += ",";
    joined += folder;
  }
  return joined;
}

std::vector<std::string> splitFolders(const std::string& value) {
  std::vector<std::string> folders;
  std::istringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto first = part.find_first_not_of(" \t");
    if (first == std::string::npos) continue;
    auto last = part.find_last_not_of(" \t");
    folders.push_back(part.substr(first, last - first + 1));
  }
  return folders;
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    if (auto value = config_data["log_file"].value<bool>()) {
      log_file = *value;
    }

    if (auto output_table = config_data["output"].as_table()) {
      if (auto value = (*output_table)["format"].value<std::string>()) {
        auto format = stringToOutputFormat(*value);
        if (!format) {
          return std::unexpected(format.error());
        }
        output.format = *format;
      }
      if (auto value = (*output_table)["badges"].value<bool>()) {
        output.badges = *value;
      }
    }

    if (auto folders_array = config_data["folders"].as_array()) {
      folders.clear();
      for (const auto& folder : *folders_array) {
        if (auto folder_str = folder.value<std::string>()) {
          folders.push_back(*folder_str);
        }
      }
    }

    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("log_level", log_level);
  config_data.insert_or_assign("log_file", log_file);

  auto output_table = toml::table{};
  output_table.insert_or_assign("format", outputFormatToString(output.format));
  output_table.insert_or_assign("badges", output.badges);
  config_data.insert_or_assign("output", output_table);

  auto folders_array = toml::array{};
  for (const auto& folder : folders) {
    folders_array.push_back(folder);
  }
  config_data.insert_or_assign("folders", folders_array);

  std::stringstream ss;
  ss << config_data;
  auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }
  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    if (path[0] == "log_level") return log_level;
    if (path[0] == "log_file") return std::string(log_file ? "true" : "false");
    if (path[0] == "folders") return joinFolders(folders);
  } else if (path.size() == 2 && path[0] == "output") {
    if (path[1] == "format") return outputFormatToString(output.format);
    if (path[1] == "badges") return std::string(output.badges ? "true" : "false");
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    if (path[0] == "log_level") {
      if (std::find(kLogLevels.begin(), kLogLevels.end(), value) == kLogLevels.end()) {
        return std::unexpected(makeError(ErrorCode::kValidationError,
                                         "Invalid log level: " + value));
      }
      log_level = value;
      return {};
    }
    if (path[0] == "log_file") {
      auto flag = stringToBool(value);
      if (!flag) return std::unexpected(flag.error());
      log_file = *flag;
      return {};
    }
    if (path[0] == "folders") {
      folders = splitFolders(value);
      return {};
    }
  } else if (path.size() == 2 && path[0] == "output") {
    if (path[1] == "format") {
      auto format = stringToOutputFormat(value);
      if (!format) return std::unexpected(format.error());
      output.format = *format;
      return {};
    }
    if (path[1] == "badges") {
      auto flag = stringToBool(value);
      if (!flag) return std::unexpected(flag.error());
      output.badges = *flag;
      return {};
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

std::vector<std::pair<std::string, std::string>> Config::list() const {
  std::vector<std::pair<std::string, std::string>> entries;
  for (const char* key : {"log_level", "log_file", "output.format", "output.badges", "folders"}) {
    auto value = get(key);
    entries.emplace_back(key, value.value_or(""));
  }
  return entries;
}

Result<void> Config::validate() const {
  if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log_level: " + log_level));
  }

  for (const auto& folder : folders) {
    if (folder.empty()) {
      return std::unexpected(makeError(ErrorCode::kConfigError, "Empty folder name in folders"));
    }
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText: return "text";
    case OutputFormat::kJson: return "json";
  }
  return "text";
}

Result<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::unexpected(makeError(ErrorCode::kValidationError,
                                   "Invalid output format: " + str + " (expected text or json)"));
}

Result<bool> Config::stringToBool(const std::string& str) {
  if (str == "true" || str == "yes" || str == "1" || str == "on") return true;
  if (str == "false" || str == "no" || str == "0" || str == "off") return false;
  return std::unexpected(makeError(ErrorCode::kValidationError,
                                   "Invalid boolean value: " + str));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace tq::config
