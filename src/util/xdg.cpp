#include "tq/util/xdg.hpp"

#include <cstdlib>

namespace tq::util {

std::filesystem::path Xdg::baseDir(const std::string& env_name, const std::string& home_suffix,
                                   const std::string& fallback_name) {
  std::string xdg_dir = getEnvVar(env_name, "");
  if (!xdg_dir.empty()) {
    return std::filesystem::path(xdg_dir) / "tq";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / fallback_name;
  }

  return std::filesystem::path(home) / home_suffix / "tq";
}

std::filesystem::path Xdg::dataHome() {
  return baseDir("XDG_DATA_HOME", ".local/share", ".tq_data");
}

std::filesystem::path Xdg::configHome() {
  return baseDir("XDG_CONFIG_HOME", ".config", ".tq_config");
}

bool Xdg::ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms) {
  std::error_code ec;

  if (std::filesystem::exists(path, ec)) {
    return !ec;
  }

  if (!std::filesystem::create_directories(path, ec)) {
    return false;
  }

  std::filesystem::permissions(path, perms, ec);
  return !ec;
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::logFile() {
  return dataHome() / "logs" / "tq.log";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace tq::util
