#include <ansiviz/repository_model_assembler.h>

#include <ansiviz/inventory_parser.h>
#include <ansiviz/playbook_parser.h>
#include <ansiviz/role_resolver.h>

#include <deque>
#include <filesystem>
#include <set>
#include <string>
#include <utility>

namespace ansiviz {

namespace {

void MergeGroups(GroupList &target, GroupList groups) {
  for (auto &group : groups) {
    UpsertGroup(target, std::move(group));
  }
}

void CollectPlaybookRoles(const Playbook &playbook,
                          std::set<std::string> &roles) {
  for (const auto &play : playbook.plays) {
    roles.insert(play.roles.begin(), play.roles.end());
    CollectRoleReferences(play.tasks, roles);
  }
}

} // namespace

RepositoryModelAssembler::RepositoryModelAssembler(
    std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

RepositoryModel
RepositoryModelAssembler::Build(const GenerationRequest &request) {
  const std::filesystem::path root(request.repository_root);
  auto diagnostics = std::make_shared<DiagnosticsLogger>(logger_);

  RepositoryModel model;

  const InventoryParser inventory_parser(diagnostics);
  for (const auto &inventory : request.inventory_paths) {
    MergeGroups(model.groups, inventory_parser.Parse(inventory));
  }

  PlaybookParser playbook_parser(root, diagnostics);
  std::set<std::string> parsed;
  std::deque<std::string> pending(request.playbook_paths.begin(),
                                  request.playbook_paths.end());
  while (!pending.empty()) {
    const auto path = std::filesystem::path(pending.front());
    pending.pop_front();

    const auto key = PlaybookKey(path);
    if (!parsed.insert(key).second) {
      diagnostics->Log(LogLevel::kDebug, "playbook.skipped",
                       {{"path", key}, {"reason", "already parsed"}});
      continue;
    }

    auto playbook = playbook_parser.Parse(path);
    CollectPlaybookRoles(playbook, model.role_names);
    for (const auto &imported : playbook.imported_playbooks) {
      if (parsed.count(imported) == 0 &&
          std::filesystem::is_regular_file(imported)) {
        pending.push_back(imported);
      }
    }
    model.playbooks.push_back(std::move(playbook));
  }

  RoleResolver role_resolver(root, diagnostics);
  auto resolution = role_resolver.Resolve(model.role_names);
  model.role_names = std::move(resolution.role_names);
  model.roles = std::move(resolution.roles);
  model.diagnostics = diagnostics->Diagnostics();

  logger_->Log(LogLevel::kInfo, "model.assembled",
               {{"groups", std::to_string(model.groups.size())},
                {"playbooks", std::to_string(model.playbooks.size())},
                {"roles", std::to_string(model.roles.size())},
                {"diagnostics", std::to_string(model.diagnostics.size())}});
  return model;
}

} // namespace ansiviz
