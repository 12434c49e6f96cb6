#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace implnav::test {

// Temporary workspace directory, removed with the fixture
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("implnav_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / prefix;
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;
  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> const std::filesystem::path& {
    return temp_dir_;
  }

  auto CreateFile(std::string_view filename, std::string_view content) const
      -> std::filesystem::path {
    auto file_path = temp_dir_ / filename;
    std::ofstream file(file_path);
    file << content;
    return file_path;
  }

  auto RemoveFile(std::string_view filename) const -> void {
    std::filesystem::remove(temp_dir_ / filename);
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace implnav::test
