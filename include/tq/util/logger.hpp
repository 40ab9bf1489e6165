#pragma once

#include <string>

#include <spdlog/spdlog.h>

#include "tq/common.hpp"

namespace tq::util {

/**
 * @brief Process-wide "tq" logger
 *
 * Installs a stderr sink and, optionally, a rotating file sink under the
 * XDG data directory, then registers the logger as spdlog's default so
 * library code can log through the spdlog free functions.
 */
class Logger {
 public:
  static Logger& instance();

  // Safe to call again; later calls only adjust the level
  void initialize(spdlog::level::level_enum level, bool log_to_file);

  void setLevel(spdlog::level::level_enum level);

  bool initialized() const { return initialized_; }

  // "trace", "debug", "info", "warn", "error", "off"
  static Result<spdlog::level::level_enum> parseLevel(const std::string& name);

 private:
  Logger() = default;

  bool initialized_ = false;
};

}  // namespace tq::util
