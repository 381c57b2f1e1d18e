#pragma once

#include <ansiviz/logging.h>
#include <ansiviz/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace ansiviz {

class TaskExtractor {
public:
  explicit TaskExtractor(std::filesystem::path repository_root,
                         std::shared_ptr<Logger> logger = nullptr);

  TaskNode Extract(const YAML::Node &raw,
                   const std::filesystem::path &including_file);

  std::vector<TaskNode> ExtractAll(const YAML::Node &tasks,
                                   const std::filesystem::path &including_file);

private:
  TaskMetadata ExtractMetadata(const YAML::Node &raw) const;
  IncludeTasks ExtractInclude(const YAML::Node &target,
                              const std::filesystem::path &including_file);
  std::optional<std::pair<std::filesystem::path, YAML::Node>>
  LoadTaskFile(const std::string &file,
               const std::filesystem::path &including_file) const;

  std::filesystem::path repository_root_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::filesystem::path> include_chain_;
};

} // namespace ansiviz
