#ifndef ANSIVIZ_TEST_SUPPORT_TEMPORARY_REPOSITORY_H
#define ANSIVIZ_TEST_SUPPORT_TEMPORARY_REPOSITORY_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace ansiviz {
namespace test {

class TemporaryRepository {
public:
  TemporaryRepository() {
    static std::atomic<unsigned> sequence{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("ansiviz-repo-" + std::to_string(timestamp) + "-" +
             std::to_string(sequence++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryRepository() {
    std::error_code error;
    std::filesystem::remove_all(root_, error);
  }

  TemporaryRepository(const TemporaryRepository &) = delete;
  TemporaryRepository &operator=(const TemporaryRepository &) = delete;

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

} // namespace test
} // namespace ansiviz

#endif // ANSIVIZ_TEST_SUPPORT_TEMPORARY_REPOSITORY_H
