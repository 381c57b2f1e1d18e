#include <ansiviz/task_extractor.h>

#include <ansiviz/yaml_document.h>

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <string>

namespace ansiviz {

namespace {

constexpr const char *kBlockSections[] = {"block", "rescue", "always"};

std::optional<YAML::Node>
FirstTruthy(const YAML::Node &raw, std::initializer_list<const char *> keys) {
  for (const auto *key : keys) {
    const auto value = raw[key];
    if (IsTruthy(value)) {
      return value;
    }
  }
  return std::nullopt;
}

bool IsPresent(const YAML::Node &node) { return node && !node.IsNull(); }

// Keeps the include chain accurate when extraction leaves early.
class IncludeChainEntry {
public:
  IncludeChainEntry(std::vector<std::filesystem::path> &chain,
                    std::filesystem::path file)
      : chain_(&chain) {
    chain_->push_back(std::move(file));
  }
  ~IncludeChainEntry() { chain_->pop_back(); }

  IncludeChainEntry(const IncludeChainEntry &) = delete;
  IncludeChainEntry &operator=(const IncludeChainEntry &) = delete;

private:
  std::vector<std::filesystem::path> *chain_;
};

} // namespace

TaskExtractor::TaskExtractor(std::filesystem::path repository_root,
                             std::shared_ptr<Logger> logger)
    : repository_root_(std::move(repository_root)),
      logger_(EnsureLogger(std::move(logger))) {}

TaskNode TaskExtractor::Extract(const YAML::Node &raw,
                                const std::filesystem::path &including_file) {
  TaskNode node;
  if (!raw.IsMap()) {
    return node;
  }
  node.metadata = ExtractMetadata(raw);

  if (raw["block"]) {
    BlockTask block;
    for (const auto *section : kBlockSections) {
      auto tasks = ExtractAll(raw[section], including_file);
      std::move(tasks.begin(), tasks.end(),
                std::back_inserter(block.children));
    }
    node.body = std::move(block);
    return node;
  }

  if (const auto role = FirstTruthy(raw, {"include_role", "import_role"})) {
    node.body = RoleReference{NameOf(*role, {"name"})};
    return node;
  }

  if (const auto include =
          FirstTruthy(raw, {"include_tasks", "import_tasks"})) {
    node.body = ExtractInclude(*include, including_file);
    return node;
  }

  node.body = PlainTask{};
  return node;
}

std::vector<TaskNode>
TaskExtractor::ExtractAll(const YAML::Node &tasks,
                          const std::filesystem::path &including_file) {
  std::vector<TaskNode> nodes;
  if (!tasks || !tasks.IsSequence()) {
    return nodes;
  }
  nodes.reserve(tasks.size());
  for (const auto &task : tasks) {
    if (task.IsMap()) {
      nodes.push_back(Extract(task, including_file));
    }
  }
  return nodes;
}

TaskMetadata TaskExtractor::ExtractMetadata(const YAML::Node &raw) const {
  TaskMetadata metadata;

  const auto name = raw["name"];
  if (IsPresent(name)) {
    metadata.name = ScalarText(name);
  }

  const auto when = raw["when"];
  if (IsPresent(when)) {
    metadata.when = ToStringList(when);
  }

  const auto tags = raw["tags"];
  if (IsPresent(tags)) {
    metadata.tags = ToStringList(tags);
  }

  if (IsTruthy(raw["become"])) {
    metadata.become = true;
    const auto become_user = raw["become_user"];
    if (IsTruthy(become_user)) {
      metadata.become_user = ScalarText(become_user);
    }
  }

  const auto notify = raw["notify"];
  if (IsTruthy(notify)) {
    metadata.notify = ToStringList(notify);
  }

  return metadata;
}

IncludeTasks
TaskExtractor::ExtractInclude(const YAML::Node &target,
                              const std::filesystem::path &including_file) {
  IncludeTasks include;
  include.file = NameOf(target, {"file"});
  if (include.file.empty()) {
    return include;
  }

  const auto loaded = LoadTaskFile(include.file, including_file);
  if (!loaded) {
    return include;
  }

  const auto canonical = std::filesystem::weakly_canonical(loaded->first);
  if (std::find(include_chain_.begin(), include_chain_.end(), canonical) !=
      include_chain_.end()) {
    logger_->Log(LogLevel::kWarn, "include.cycle",
                 {{"file", loaded->first.string()},
                  {"included_from", including_file.string()}});
    return include;
  }

  IncludeChainEntry entry(include_chain_, canonical);
  include.included = ExtractAll(loaded->second, loaded->first);
  return include;
}

std::optional<std::pair<std::filesystem::path, YAML::Node>>
TaskExtractor::LoadTaskFile(const std::string &file,
                            const std::filesystem::path &including_file) const {
  const std::vector<std::filesystem::path> candidates = {
      including_file.parent_path() / file, repository_root_ / file};

  for (const auto &candidate : candidates) {
    if (!std::filesystem::is_regular_file(candidate)) {
      continue;
    }
    try {
      auto document = LoadYamlDocument(candidate);
      if (document.IsSequence() && document.size() > 0) {
        return std::make_pair(candidate.lexically_normal(),
                              std::move(document));
      }
    } catch (const std::runtime_error &ex) {
      logger_->Log(LogLevel::kWarn, "include.unreadable",
                   {{"file", candidate.string()}, {"reason", ex.what()}});
    }
  }

  logger_->Log(LogLevel::kWarn, "include.missing",
               {{"file", file}, {"included_from", including_file.string()}});
  return std::nullopt;
}

} // namespace ansiviz
