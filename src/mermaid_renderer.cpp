#include <ansiviz/mermaid_renderer.h>

#include <ansiviz/escaping.h>

#include <filesystem>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ansiviz {
namespace {

constexpr const char kNodeIndent[] = "        ";
constexpr const char kEdgeIndent[] = "    ";
constexpr const char kDefaultBecomeUser[] = "root";

template <typename Collection>
std::string Join(const Collection &items, const std::string &delimiter) {
  std::ostringstream output;
  bool first = true;
  for (const auto &item : items) {
    if (!first) {
      output << delimiter;
    }
    output << item;
    first = false;
  }
  return output.str();
}

std::string FileName(const std::string &path) {
  return std::filesystem::path(path).filename().string();
}

std::string RoleId(const std::string &role_name) {
  return SanitizeId("role_" + role_name);
}

std::string HandlerId(const std::string &handler_name) {
  return SanitizeId("handler_" + handler_name);
}

// Node ids of one style class, in first-insertion order, each once.
class IdBucket {
public:
  bool Add(const std::string &id) {
    if (!seen_.insert(id).second) {
      return false;
    }
    ids_.push_back(id);
    return true;
  }
  bool empty() const { return ids_.empty(); }
  const std::vector<std::string> &ids() const { return ids_; }

private:
  std::vector<std::string> ids_;
  std::unordered_set<std::string> seen_;
};

struct NodeBuckets {
  IdBucket groups;
  IdBucket hosts;
  IdBucket playbooks;
  IdBucket roles;
  IdBucket tasks;
  IdBucket handlers;
  IdBucket includes;
  IdBucket tags;
  IdBucket becomes;
};

struct Annotations {
  const std::vector<std::string> &tags;
  bool become;
  const std::optional<std::string> &become_user;
};

using Lines = std::vector<std::string>;

class DiagramBuilder {
public:
  explicit DiagramBuilder(const RepositoryModel &model) : model_(model) {}

  std::string Build(const GenerationRequest &request) {
    RenderInventory();
    RenderPlaybooks();
    RenderRoles();

    Lines lines;
    lines.push_back("graph " + LayoutToken(request.layout));
    if (!request.repository_root.empty()) {
      lines.push_back("%% repository: " + request.repository_root);
    }
    AppendSubgraph(lines, "inventory", "Inventory", inventory_lines_);
    AppendSubgraph(lines, "playbooks_section", "Playbooks", playbook_lines_);
    AppendSubgraph(lines, "roles_section", "Roles", role_lines_);
    lines.insert(lines.end(), connections_.begin(), connections_.end());
    const auto &definitions = MermaidClassDefinitions();
    lines.insert(lines.end(), definitions.begin(), definitions.end());
    AppendClassAssignments(lines);
    return Join(lines, "\n");
  }

private:
  void RenderInventory() {
    for (const auto &group : model_.groups) {
      const auto group_id = SanitizeId(group.name);
      nodes_.groups.Add(group_id);
      inventory_lines_.push_back(kNodeIndent + group_id +
                                 "[[\"fa:fa-layer-group " +
                                 EscapeLabel(group.name) + "\"]]");
      for (const auto &host : group.hosts) {
        const auto host_id = SanitizeId(host);
        nodes_.hosts.Add(host_id);
        inventory_lines_.push_back(kNodeIndent + host_id +
                                   "((\"fa:fa-server " + EscapeLabel(host) +
                                   "\"))");
        inventory_lines_.push_back(kNodeIndent + group_id + " --- " +
                                   host_id);
      }
    }
  }

  void RenderPlaybooks() {
    for (const auto &playbook : model_.playbooks) {
      const auto playbook_id = SanitizeId(playbook.name);
      nodes_.playbooks.Add(playbook_id);
      playbook_lines_.push_back(kNodeIndent + playbook_id + "[\"fa:fa-book " +
                                EscapeLabel(playbook.name) + "\"]");

      for (std::size_t index = 0; index < playbook.plays.size(); ++index) {
        RenderPlay(playbook.plays[index], playbook_id,
                   playbook_id + "_play_" + std::to_string(index));
      }

      for (const auto &imported : playbook.imported_playbooks) {
        connections_.push_back(kEdgeIndent + playbook_id +
                               " -->|\"imports\"| " +
                               SanitizeId(FileName(imported)));
      }
    }
  }

  void RenderPlay(const Play &play, const std::string &playbook_id,
                  const std::string &play_id) {
    if (!play.hosts.empty()) {
      connections_.push_back(kEdgeIndent + SanitizeId(play.hosts) +
                             " -->|\"runs\"| " + playbook_id);
    }

    RenderAnnotations(Annotations{play.tags, play.become, play.become_user},
                      playbook_id, play_id, playbook_lines_);

    for (const auto &role_name : play.roles) {
      const auto role_id = EnsureRoleNode(role_name);
      connections_.push_back(kEdgeIndent + playbook_id + " ==>|\"uses\"| " +
                             role_id);
    }

    for (const auto &task : play.tasks) {
      RenderTask(task, playbook_id, playbook_lines_);
    }

    for (const auto &handler_name : play.handlers) {
      EnsureHandlerNode(handler_name, playbook_lines_);
    }
  }

  void RenderRoles() {
    for (const auto &role_name : model_.role_names) {
      EnsureRoleNode(role_name);
    }
    for (const auto &[role_name, role] : model_.roles) {
      const auto role_id = EnsureRoleNode(role_name);
      for (const auto &dependency : role.dependencies) {
        connections_.push_back(kEdgeIndent + role_id + " -->|\"depends\"| " +
                               EnsureRoleNode(dependency));
      }
    }
  }

  // Declares the role node and its task tree in the Roles subgraph the first
  // time the role is referenced.
  std::string EnsureRoleNode(const std::string &role_name) {
    const auto role_id = RoleId(role_name);
    if (!rendered_roles_.insert(role_name).second) {
      return role_id;
    }
    nodes_.roles.Add(role_id);
    role_lines_.push_back(kNodeIndent + role_id + "{\"fa:fa-cube " +
                          EscapeLabel(role_name) + "\"}");

    const auto found = model_.roles.find(role_name);
    if (found != model_.roles.end()) {
      for (const auto &task : found->second.tasks) {
        RenderTask(task, role_id, role_lines_);
      }
    }
    return role_id;
  }

  std::string EnsureHandlerNode(const std::string &handler_name,
                                Lines &lines) {
    const auto handler_id = HandlerId(handler_name);
    if (nodes_.handlers.Add(handler_id)) {
      lines.push_back(kNodeIndent + handler_id + "([\"fa:fa-bell " +
                      EscapeLabel(handler_name) + "\"])");
    }
    return handler_id;
  }

  void RenderTask(const TaskNode &task, const std::string &parent_id,
                  Lines &lines) {
    const auto &metadata = task.metadata;
    const Annotations annotations{metadata.tags, metadata.become,
                                  metadata.become_user};

    if (const auto *role = std::get_if<RoleReference>(&task.body)) {
      if (!role->role_name.empty()) {
        const auto role_id = EnsureRoleNode(role->role_name);
        connections_.push_back(kEdgeIndent + parent_id + " ==> " + role_id);
      }
      return;
    }

    if (const auto *include = std::get_if<IncludeTasks>(&task.body)) {
      const auto file_name = FileName(include->file);
      const auto include_id = SanitizeId("include_" + file_name);
      nodes_.includes.Add(include_id);
      lines.push_back(kNodeIndent + include_id + "[/\"" +
                      EscapeLabel(file_name) + "\"/]");
      lines.push_back(kNodeIndent + parent_id + " --> " + include_id);
      for (const auto &included : include->included) {
        RenderTask(included, include_id, lines);
      }
      return;
    }

    if (const auto *block = std::get_if<BlockTask>(&task.body)) {
      const auto block_id = parent_id + "_block_" + NextIndex();
      nodes_.tasks.Add(block_id);
      lines.push_back(kNodeIndent + block_id + "[\"" + TaskLabel(metadata) +
                      "\"]");
      lines.push_back(kNodeIndent + parent_id + " --> " + block_id);
      RenderAnnotations(annotations, block_id, block_id, lines);
      for (const auto &child : block->children) {
        RenderTask(child, block_id, lines);
      }
      return;
    }

    const auto task_id = parent_id + "_task_" + NextIndex();
    nodes_.tasks.Add(task_id);
    lines.push_back(kNodeIndent + task_id + "[\"" + TaskLabel(metadata) +
                    "\"]");
    lines.push_back(kNodeIndent + parent_id + " --> " + task_id);
    RenderAnnotations(annotations, task_id, task_id, lines);

    for (const auto &handler_name : metadata.notify) {
      const auto handler_id = EnsureHandlerNode(handler_name, lines);
      connections_.push_back(kEdgeIndent + task_id +
                             " -.->|\"notifies\"| " + handler_id);
    }
  }

  // Tags and become are drawn as detached nodes linked to `owner_id` by a
  // dashed line; their ids derive from `prefix`.
  void RenderAnnotations(const Annotations &annotations,
                         const std::string &owner_id,
                         const std::string &prefix, Lines &lines) {
    if (!annotations.tags.empty()) {
      const auto tag_id = prefix + "_tags";
      nodes_.tags.Add(tag_id);
      lines.push_back(kNodeIndent + tag_id + ">\"fa:fa-tags " +
                      EscapeLabel(Join(annotations.tags, ", ")) + "\"]");
      lines.push_back(kNodeIndent + owner_id + " -.- " + tag_id);
    }
    if (annotations.become) {
      const auto become_id = prefix + "_become";
      nodes_.becomes.Add(become_id);
      lines.push_back(
          kNodeIndent + become_id + "([\"fa:fa-key " +
          EscapeLabel(annotations.become_user.value_or(kDefaultBecomeUser)) +
          "\"])");
      lines.push_back(kNodeIndent + owner_id + " -.- " + become_id);
    }
  }

  static std::string TaskLabel(const TaskMetadata &metadata) {
    auto label = EscapeLabel(metadata.name);
    if (!metadata.when.empty()) {
      label += "<br/>fa:fa-question when: " +
               EscapeLabel(Join(metadata.when, " AND "));
    }
    return label;
  }

  std::string NextIndex() { return std::to_string(task_counter_++); }

  static void AppendSubgraph(Lines &lines, const std::string &id,
                             const std::string &title, const Lines &body) {
    lines.push_back(kEdgeIndent + ("subgraph " + id) + "[\"" + title +
                    "\"]");
    lines.push_back(std::string(kEdgeIndent) + "direction TB");
    lines.insert(lines.end(), body.begin(), body.end());
    lines.push_back(std::string(kEdgeIndent) + "end");
  }

  void AppendClassAssignments(Lines &lines) const {
    const std::pair<const IdBucket *, const char *> assignments[] = {
        {&nodes_.groups, "groupClass"},
        {&nodes_.hosts, "hostClass"},
        {&nodes_.playbooks, "playbookClass"},
        {&nodes_.roles, "roleClass"},
        {&nodes_.tasks, "taskClass"},
        {&nodes_.handlers, "handlerClass"},
        {&nodes_.includes, "includeClass"},
        {&nodes_.tags, "tagClass"},
        {&nodes_.becomes, "becomeClass"}};
    for (const auto &[bucket, class_name] : assignments) {
      if (bucket->empty()) {
        continue;
      }
      lines.push_back(std::string(kEdgeIndent) + "class " +
                      Join(bucket->ids(), ",") + " " + class_name);
    }
  }

  const RepositoryModel &model_;
  Lines inventory_lines_;
  Lines playbook_lines_;
  Lines role_lines_;
  Lines connections_;
  NodeBuckets nodes_;
  std::set<std::string> rendered_roles_;
  std::size_t task_counter_ = 0;
};

} // namespace

const std::vector<std::string> &MermaidClassDefinitions() {
  static const std::vector<std::string> definitions = {
      "classDef groupClass fill:#e1f5fe,stroke:#01579b,stroke-width:2px",
      "classDef hostClass fill:#fff3e0,stroke:#e65100,stroke-width:1px",
      "classDef playbookClass fill:#e8f5e9,stroke:#1b5e20,stroke-width:3px",
      "classDef roleClass fill:#f3e5f5,stroke:#4a148c,stroke-width:2px",
      "classDef taskClass fill:#fafafa,stroke:#616161,stroke-width:1px",
      "classDef handlerClass fill:#fff8e1,stroke:#ff6f00,stroke-width:1px,"
      "stroke-dasharray: 5 5",
      "classDef includeClass fill:#e0f2f1,stroke:#00695c,stroke-width:1px",
      "classDef tagClass fill:#e8eaf6,stroke:#283593,stroke-width:1px,"
      "stroke-dasharray: 3 3",
      "classDef becomeClass fill:#fce4ec,stroke:#b71c1c,stroke-width:1px,"
      "stroke-dasharray: 3 3"};
  return definitions;
}

std::string MermaidDiagramRenderer::Render(const RepositoryModel &model,
                                           const GenerationRequest &request) {
  DiagramBuilder builder(model);
  return builder.Build(request);
}

} // namespace ansiviz
