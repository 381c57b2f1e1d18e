#include <ansiviz/playbook_parser.h>

#include <ansiviz/errors.h>
#include <ansiviz/yaml_document.h>

#include <iterator>
#include <string>
#include <utility>

namespace ansiviz {

namespace {

constexpr const char kDefaultHandlerName[] = "unnamed_handler";
constexpr const char *kTaskSections[] = {"pre_tasks", "tasks", "post_tasks"};

std::string JoinPatterns(const std::vector<std::string> &patterns) {
  std::string joined;
  for (std::size_t i = 0; i < patterns.size(); ++i) {
    if (i > 0) {
      joined += ",";
    }
    joined += patterns[i];
  }
  return joined;
}

std::string HostPattern(const YAML::Node &hosts) {
  if (hosts && hosts.IsSequence()) {
    return JoinPatterns(ToStringList(hosts));
  }
  return ScalarText(hosts);
}

} // namespace

std::string PlaybookKey(const std::filesystem::path &path) {
  return path.lexically_normal().generic_string();
}

PlaybookParser::PlaybookParser(std::filesystem::path repository_root,
                               std::shared_ptr<Logger> logger)
    : extractor_(std::move(repository_root), logger),
      logger_(EnsureLogger(std::move(logger))) {}

Playbook PlaybookParser::Parse(const std::filesystem::path &path) {
  Playbook playbook;
  playbook.path = PlaybookKey(path);
  playbook.name = path.filename().string();

  if (!std::filesystem::is_regular_file(path)) {
    throw MissingResourceError(path.string(), "Playbook not found");
  }

  const auto document = LoadYamlDocument(path);
  if (!document.IsSequence() || document.size() == 0) {
    logger_->Log(LogLevel::kWarn, "playbook.empty", {{"path", path.string()}});
    return playbook;
  }

  for (const auto &entry : document) {
    if (!entry.IsMap()) {
      continue;
    }

    const auto import_target = entry["import_playbook"];
    if (IsTruthy(import_target)) {
      const auto target = path.parent_path() / ScalarText(import_target);
      if (std::filesystem::is_regular_file(target)) {
        playbook.imported_playbooks.push_back(PlaybookKey(target));
      } else {
        logger_->Log(LogLevel::kWarn, "playbook.import.missing",
                     {{"path", path.string()},
                      {"target", PlaybookKey(target)}});
      }
      continue;
    }

    playbook.plays.push_back(ParsePlay(entry, path));
  }

  logger_->Log(LogLevel::kDebug, "playbook.parsed",
               {{"path", playbook.path},
                {"plays", std::to_string(playbook.plays.size())},
                {"imports",
                 std::to_string(playbook.imported_playbooks.size())}});
  return playbook;
}

Play PlaybookParser::ParsePlay(const YAML::Node &raw,
                               const std::filesystem::path &path) {
  Play play;
  play.hosts = HostPattern(raw["hosts"]);

  if (IsTruthy(raw["become"])) {
    play.become = true;
    const auto become_user = raw["become_user"];
    if (IsTruthy(become_user)) {
      play.become_user = ScalarText(become_user);
    }
  }

  play.tags = ToStringList(raw["tags"]);

  const auto roles = raw["roles"];
  if (roles && roles.IsSequence()) {
    for (const auto &role : roles) {
      auto name = NameOf(role, {"role", "name"});
      if (!name.empty()) {
        play.roles.push_back(std::move(name));
      }
    }
  }

  for (const auto *section : kTaskSections) {
    auto tasks = extractor_.ExtractAll(raw[section], path);
    std::move(tasks.begin(), tasks.end(), std::back_inserter(play.tasks));
  }

  const auto handlers = raw["handlers"];
  if (handlers && handlers.IsSequence()) {
    for (const auto &handler : handlers) {
      if (!handler.IsMap()) {
        continue;
      }
      const auto name = handler["name"];
      play.handlers.push_back(name && !name.IsNull() ? ScalarText(name)
                                                     : kDefaultHandlerName);
    }
  }

  return play;
}

} // namespace ansiviz
