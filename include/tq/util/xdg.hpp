#pragma once

#include <filesystem>
#include <string>

namespace tq::util {

// XDG Base Directory locations for tq
class Xdg {
 public:
  // $XDG_DATA_HOME/tq, or ~/.local/share/tq
  static std::filesystem::path dataHome();

  // $XDG_CONFIG_HOME/tq, or ~/.config/tq
  static std::filesystem::path configHome();

  // Create the directory (and parents) if missing and apply `perms`
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

  static std::filesystem::path configFile();

  // Rotating log file used when file logging is enabled
  static std::filesystem::path logFile();

 private:
  static std::string getEnvVar(const std::string& name, const std::string& default_value);

  static std::filesystem::path baseDir(const std::string& env_name, const std::string& home_suffix,
                                       const std::string& fallback_name);
};

}  // namespace tq::util
