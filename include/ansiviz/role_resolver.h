#pragma once

#include <ansiviz/logging.h>
#include <ansiviz/models.h>
#include <ansiviz/task_extractor.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ansiviz {

// Finds role files by convention: <any>/roles/<name>/<section>/main.yml, then
// main.yaml. Hidden directories are not scanned.
class RoleLocator {
public:
  explicit RoleLocator(std::filesystem::path repository_root);

  std::vector<std::filesystem::path>
  Candidates(const std::string &role_name, const std::string &section);

  const std::vector<std::filesystem::path> &RolesDirectories();

private:
  std::filesystem::path repository_root_;
  std::optional<std::vector<std::filesystem::path>> roles_directories_;
};

class RoleResolver {
public:
  explicit RoleResolver(std::filesystem::path repository_root,
                        std::shared_ptr<Logger> logger = nullptr);

  std::vector<TaskNode> LoadTasks(const std::string &role_name);

  std::vector<std::string> LoadDependencies(const std::string &role_name);

  // Transitive closure over meta dependencies and include_role/import_role
  // references in role tasks. Each role is loaded once.
  RoleResolution Resolve(const std::set<std::string> &roots);

private:
  RoleLocator locator_;
  TaskExtractor extractor_;
  std::shared_ptr<Logger> logger_;
};

} // namespace ansiviz
