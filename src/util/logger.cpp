#include "tq/util/logger.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "tq/util/xdg.hpp"

namespace tq::util {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr std::size_t kMaxFileSize = 1024 * 1024 * 5;  // 5MB files, 3 backups
constexpr std::size_t kMaxFiles = 3;

}  // namespace

Logger& Logger::instance() {
  static Logger instance_;
  return instance_;
}

void Logger::initialize(spdlog::level::level_enum level, bool log_to_file) {
  if (initialized_) {
    setLevel(level);
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::string file_error;
  if (log_to_file) {
    try {
      const auto log_file = Xdg::logFile();
      if (!Xdg::ensureDirectory(log_file.parent_path(), std::filesystem::perms::owner_all)) {
        file_error = "cannot create " + log_file.parent_path().string();
      } else {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxFileSize, kMaxFiles));
      }
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("tq", sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  initialized_ = true;

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

void Logger::setLevel(spdlog::level::level_enum level) {
  spdlog::set_level(level);
}

Result<spdlog::level::level_enum> Logger::parseLevel(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unknown log level: " + name));
}

}  // namespace tq::util
