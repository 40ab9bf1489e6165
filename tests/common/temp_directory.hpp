#pragma once

#include <filesystem>
#include <string>

namespace tq::test {

// Scratch directory under $TMPDIR/tq_test, removed with the object
class TempDirectory {
 public:
  TempDirectory();
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  TempDirectory(TempDirectory&&) = default;
  TempDirectory& operator=(TempDirectory&&) = default;

  const std::filesystem::path& path() const { return path_; }

  // Path inside the directory; nothing is created
  std::filesystem::path file(const std::string& name) const { return path_ / name; }

  std::filesystem::path createFile(const std::string& name, const std::string& content = "");

  // Whole file content, or empty when it cannot be opened
  std::string readFile(const std::string& name) const;

  void cleanup();

 private:
  std::filesystem::path path_;
};

}  // namespace tq::test
