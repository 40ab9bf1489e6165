#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "tq/common.hpp"

namespace tq::config {

// Configuration for the tq command-line front-end
class Config {
 public:
  // Defaults only; call load() to read a file
  Config() = default;

  enum class OutputFormat {
    kText,
    kJson
  };

  // Logging
  std::string log_level = "warn";  // trace, debug, info, warn, error, off
  bool log_file = false;           // Also log to $XDG_DATA_HOME/tq/logs/tq.log

  struct OutputConfig {
    OutputFormat format = OutputFormat::kText;
    bool badges = true;  // Show display badges after text-mode parse output
  };
  OutputConfig output;

  // Known folder names that "@folder" markers are resolved against
  std::vector<std::string> folders;

  // Load configuration from file. A missing file yields kFileNotFound and
  // leaves the defaults untouched.
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (the loaded path when none is given)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation ("output.format")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Every key with its current value, in file order
  std::vector<std::pair<std::string, std::string>> list() const;

  Result<void> validate() const;

  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& path() const { return config_path_; }
  void setPath(const std::filesystem::path& config_path) { config_path_ = config_path; }

  static std::string outputFormatToString(OutputFormat format);

 private:
  std::filesystem::path config_path_;

  static Result<OutputFormat> stringToOutputFormat(const std::string& str);
  static Result<bool> stringToBool(const std::string& str);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace tq::config
