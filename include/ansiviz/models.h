#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace ansiviz {

enum class LayoutDirection { kLeftRight, kRightLeft, kTopBottom, kTopDown,
                             kBottomTop };

std::string LayoutToken(LayoutDirection layout);
LayoutDirection ParseLayoutDirection(const std::string &token);

struct GenerationRequest {
  std::string repository_root;
  std::vector<std::string> inventory_paths;
  std::vector<std::string> playbook_paths;
  LayoutDirection layout = LayoutDirection::kLeftRight;
};

struct Group {
  std::string name;
  std::vector<std::string> hosts;
};

using GroupList = std::vector<Group>;

const Group *FindGroup(const GroupList &groups, const std::string &name);
Group &EnsureGroup(GroupList &groups, const std::string &name);
void UpsertGroup(GroupList &groups, Group group);

struct TaskMetadata {
  std::string name = "unnamed_task";
  std::vector<std::string> when;
  std::vector<std::string> tags;
  bool become = false;
  std::optional<std::string> become_user;
  std::vector<std::string> notify;
};

struct TaskNode;

struct PlainTask {};

struct BlockTask {
  // block ++ rescue ++ always
  std::vector<TaskNode> children;
};

struct RoleReference {
  std::string role_name;
};

struct IncludeTasks {
  std::string file;
  std::vector<TaskNode> included;
};

struct TaskNode {
  TaskMetadata metadata;
  std::variant<PlainTask, BlockTask, RoleReference, IncludeTasks> body;
};

struct Play {
  std::string hosts;
  std::vector<std::string> roles;
  std::vector<TaskNode> tasks;
  std::vector<std::string> handlers;
  bool become = false;
  std::optional<std::string> become_user;
  std::vector<std::string> tags;
};

struct Playbook {
  std::string path;
  std::string name;
  std::vector<Play> plays;
  std::vector<std::string> imported_playbooks;
};

struct Role {
  std::string name;
  std::vector<TaskNode> tasks;
  std::vector<std::string> dependencies;
};

struct RoleResolution {
  std::set<std::string> role_names;
  std::map<std::string, Role> roles;
};

struct RepositoryModel {
  GroupList groups;
  std::vector<Playbook> playbooks;
  std::set<std::string> role_names;
  std::map<std::string, Role> roles;
  std::vector<std::string> diagnostics;
};

struct GenerationResult {
  std::string diagram;
  RepositoryModel model;
};

const Playbook *FindPlaybook(const RepositoryModel &model,
                             const std::string &path);

void CollectRoleReferences(const std::vector<TaskNode> &tasks,
                           std::set<std::string> &roles);

} // namespace ansiviz
