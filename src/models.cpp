#include <ansiviz/models.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace ansiviz {

std::string LayoutToken(LayoutDirection layout) {
  switch (layout) {
  case LayoutDirection::kLeftRight:
    return "LR";
  case LayoutDirection::kRightLeft:
    return "RL";
  case LayoutDirection::kTopBottom:
    return "TB";
  case LayoutDirection::kTopDown:
    return "TD";
  case LayoutDirection::kBottomTop:
    return "BT";
  }
  return "LR";
}

LayoutDirection ParseLayoutDirection(const std::string &token) {
  std::string normalized = token;
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (const auto layout :
       {LayoutDirection::kLeftRight, LayoutDirection::kRightLeft,
        LayoutDirection::kTopBottom, LayoutDirection::kTopDown,
        LayoutDirection::kBottomTop}) {
    if (LayoutToken(layout) == normalized) {
      return layout;
    }
  }
  throw std::invalid_argument("Unknown layout direction: " + token +
                              " (expected LR, RL, TB, TD or BT)");
}

const Group *FindGroup(const GroupList &groups, const std::string &name) {
  const auto found =
      std::find_if(groups.begin(), groups.end(),
                   [&](const Group &group) { return group.name == name; });
  if (found == groups.end()) {
    return nullptr;
  }
  return &*found;
}

Group &EnsureGroup(GroupList &groups, const std::string &name) {
  const auto found =
      std::find_if(groups.begin(), groups.end(),
                   [&](const Group &group) { return group.name == name; });
  if (found != groups.end()) {
    return *found;
  }
  groups.push_back(Group{name, {}});
  return groups.back();
}

void UpsertGroup(GroupList &groups, Group group) {
  auto &target = EnsureGroup(groups, group.name);
  target.hosts = std::move(group.hosts);
}

const Playbook *FindPlaybook(const RepositoryModel &model,
                             const std::string &path) {
  const auto found = std::find_if(
      model.playbooks.begin(), model.playbooks.end(),
      [&](const Playbook &playbook) { return playbook.path == path; });
  if (found == model.playbooks.end()) {
    return nullptr;
  }
  return &*found;
}

void CollectRoleReferences(const std::vector<TaskNode> &tasks,
                           std::set<std::string> &roles) {
  for (const auto &task : tasks) {
    if (const auto *role = std::get_if<RoleReference>(&task.body)) {
      if (!role->role_name.empty()) {
        roles.insert(role->role_name);
      }
    } else if (const auto *block = std::get_if<BlockTask>(&task.body)) {
      CollectRoleReferences(block->children, roles);
    } else if (const auto *include = std::get_if<IncludeTasks>(&task.body)) {
      CollectRoleReferences(include->included, roles);
    }
  }
}

} // namespace ansiviz
