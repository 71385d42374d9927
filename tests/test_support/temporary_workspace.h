#ifndef SOLID_TEST_SUPPORT_TEMPORARY_WORKSPACE_H
#define SOLID_TEST_SUPPORT_TEMPORARY_WORKSPACE_H

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace solid {
namespace test {

class TemporaryWorkspace {
public:
  TemporaryWorkspace() {
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("solid-lint-" + std::to_string(timestamp));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryWorkspace() { std::filesystem::remove_all(root_); }

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path);
    stream << content;
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

inline std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

} // namespace test
} // namespace solid

#endif // SOLID_TEST_SUPPORT_TEMPORARY_WORKSPACE_H
