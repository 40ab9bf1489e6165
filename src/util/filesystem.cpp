#include "tq/util/filesystem.hpp"

#include <fstream>
#include <random>
#include <sstream>

namespace tq::util {

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }
  return content.str();
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);
  auto temp_path = path;
  temp_path += ".tmp." + std::to_string(dis(gen));

  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create temporary file: " + temp_path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to write temporary file: " + temp_path.string()));
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot replace " + path.string() + ": " + ec.message()));
  }
  return {};
}

}  // namespace tq::util
