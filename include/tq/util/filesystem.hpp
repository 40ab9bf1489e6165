#pragma once

#include <filesystem>
#include <string>

#include "tq/common.hpp"

namespace tq::util {

// File helpers used by the config layer and the batch command
class FileSystem {
 public:
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Write to a sibling temp file, then rename over `path`
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);
};

}  // namespace tq::util
