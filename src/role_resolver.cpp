#include <ansiviz/role_resolver.h>

#include <ansiviz/yaml_document.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace ansiviz {

namespace {

constexpr const char kRolesDirectoryName[] = "roles";
constexpr const char *kRoleFileNames[] = {"main.yml", "main.yaml"};

std::vector<std::filesystem::path>
ScanRolesDirectories(const std::filesystem::path &root) {
  std::vector<std::filesystem::path> directories;
  std::error_code error;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    return directories;
  }

  std::filesystem::recursive_directory_iterator end;
  while (it != end) {
    const auto &entry = *it;
    if (entry.is_directory(error)) {
      const auto name = entry.path().filename().string();
      if (!name.empty() && name.front() == '.') {
        it.disable_recursion_pending();
      } else if (name == kRolesDirectoryName) {
        directories.push_back(entry.path().lexically_normal());
      }
    }
    it.increment(error);
    if (error) {
      break;
    }
  }

  std::sort(directories.begin(), directories.end());
  return directories;
}

} // namespace

RoleLocator::RoleLocator(std::filesystem::path repository_root)
    : repository_root_(std::move(repository_root)) {}

const std::vector<std::filesystem::path> &RoleLocator::RolesDirectories() {
  if (!roles_directories_) {
    roles_directories_ = ScanRolesDirectories(repository_root_);
  }
  return *roles_directories_;
}

std::vector<std::filesystem::path>
RoleLocator::Candidates(const std::string &role_name,
                        const std::string &section) {
  std::vector<std::filesystem::path> candidates;
  if (role_name.empty()) {
    return candidates;
  }
  for (const auto *file_name : kRoleFileNames) {
    for (const auto &directory : RolesDirectories()) {
      auto candidate = directory / role_name / section / file_name;
      if (std::filesystem::is_regular_file(candidate)) {
        candidates.push_back(std::move(candidate));
      }
    }
  }
  return candidates;
}

RoleResolver::RoleResolver(std::filesystem::path repository_root,
                           std::shared_ptr<Logger> logger)
    : locator_(repository_root), extractor_(repository_root, logger),
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<TaskNode> RoleResolver::LoadTasks(const std::string &role_name) {
  for (const auto &candidate : locator_.Candidates(role_name, "tasks")) {
    try {
      const auto document = LoadYamlDocument(candidate);
      if (document.IsSequence() && document.size() > 0) {
        return extractor_.ExtractAll(document, candidate);
      }
    } catch (const std::runtime_error &ex) {
      logger_->Log(LogLevel::kWarn, "role.tasks.unreadable",
                   {{"role", role_name},
                    {"file", candidate.string()},
                    {"reason", ex.what()}});
    }
  }

  logger_->Log(LogLevel::kWarn, "role.tasks.missing", {{"role", role_name}});
  return {};
}

std::vector<std::string>
RoleResolver::LoadDependencies(const std::string &role_name) {
  for (const auto &candidate : locator_.Candidates(role_name, "meta")) {
    try {
      const auto document = LoadYamlDocument(candidate);
      if (!document.IsMap() || document.size() == 0) {
        continue;
      }

      std::vector<std::string> dependencies;
      const auto declared = document["dependencies"];
      if (declared && declared.IsSequence()) {
        for (const auto &dependency : declared) {
          auto name = NameOf(dependency, {"role", "name"});
          if (!name.empty()) {
            dependencies.push_back(std::move(name));
          }
        }
      }
      return dependencies;
    } catch (const std::runtime_error &ex) {
      logger_->Log(LogLevel::kWarn, "role.meta.unreadable",
                   {{"role", role_name},
                    {"file", candidate.string()},
                    {"reason", ex.what()}});
    }
  }
  return {};
}

RoleResolution RoleResolver::Resolve(const std::set<std::string> &roots) {
  RoleResolution resolution;
  resolution.role_names = roots;
  std::set<std::string> processed;

  while (processed.size() < resolution.role_names.size()) {
    std::vector<std::string> pending;
    std::set_difference(resolution.role_names.begin(),
                        resolution.role_names.end(), processed.begin(),
                        processed.end(), std::back_inserter(pending));

    for (const auto &role_name : pending) {
      processed.insert(role_name);

      Role role;
      role.name = role_name;
      role.tasks = LoadTasks(role_name);
      role.dependencies = LoadDependencies(role_name);
      for (const auto &dependency : role.dependencies) {
        if (resolution.role_names.insert(dependency).second) {
          logger_->Log(LogLevel::kDebug, "role.dependency.discovered",
                       {{"role", role_name}, {"dependency", dependency}});
        }
      }

      std::set<std::string> referenced;
      CollectRoleReferences(role.tasks, referenced);
      for (const auto &reference : referenced) {
        if (resolution.role_names.insert(reference).second) {
          logger_->Log(LogLevel::kDebug, "role.reference.discovered",
                       {{"role", role_name}, {"reference", reference}});
        }
      }
      resolution.roles.emplace(role_name, std::move(role));
    }
  }

  logger_->Log(LogLevel::kInfo, "roles.resolved",
               {{"count", std::to_string(resolution.roles.size())}});
  return resolution;
}

} // namespace ansiviz
