#include <ansiviz/inventory_parser.h>

#include <ansiviz/errors.h>
#include <ansiviz/string_utils.h>
#include <ansiviz/yaml_document.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <utility>

namespace ansiviz {

namespace {

std::string FirstToken(const std::string &line) {
  std::istringstream stream(line);
  std::string token;
  stream >> token;
  return token;
}

void FlattenYamlGroup(GroupList &groups, const std::string &name,
                      const YAML::Node &content) {
  Group group{name, {}};
  if (!content.IsMap()) {
    UpsertGroup(groups, std::move(group));
    return;
  }

  const auto hosts = content["hosts"];
  if (hosts && hosts.IsMap()) {
    for (const auto &host : hosts) {
      group.hosts.push_back(ScalarText(host.first));
    }
  }
  UpsertGroup(groups, std::move(group));

  const auto children = content["children"];
  if (children && children.IsMap()) {
    for (const auto &child : children) {
      FlattenYamlGroup(groups, ScalarText(child.first), child.second);
    }
  }
}

std::optional<GroupList> TryParseYaml(const std::filesystem::path &path,
                                      Logger &logger) {
  YAML::Node root;
  try {
    root = LoadYamlDocument(path);
  } catch (const FormatError &ex) {
    logger.Log(LogLevel::kDebug, "inventory.yaml.rejected",
               {{"path", path.string()}, {"reason", ex.what()}});
    return std::nullopt;
  }
  if (!root.IsMap() || root.size() == 0) {
    return std::nullopt;
  }

  GroupList groups;
  for (const auto &entry : root) {
    FlattenYamlGroup(groups, ScalarText(entry.first), entry.second);
  }
  return groups;
}

} // namespace

InventoryParser::InventoryParser(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

GroupList InventoryParser::Parse(const std::filesystem::path &path) const {
  if (!std::filesystem::is_regular_file(path)) {
    throw MissingResourceError(path.string(), "Inventory not found");
  }

  if (auto groups = TryParseYaml(path, *logger_)) {
    logger_->Log(LogLevel::kDebug, "inventory.parsed",
                 {{"path", path.string()},
                  {"format", "yaml"},
                  {"groups", std::to_string(groups->size())}});
    return std::move(*groups);
  }

  auto groups = ParseIni(path);
  logger_->Log(LogLevel::kDebug, "inventory.parsed",
               {{"path", path.string()},
                {"format", "ini"},
                {"groups", std::to_string(groups.size())}});
  return groups;
}

GroupList InventoryParser::ParseIni(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw MissingResourceError(path.string(), "Failed to open inventory");
  }

  static const std::regex kSectionHeader(R"(^\[([^:\]]+)(?::(\w+))?\]$)");

  GroupList groups;
  std::optional<std::string> current_group;
  std::string current_section = "hosts";

  std::string raw_line;
  while (std::getline(stream, raw_line)) {
    const auto line = Trim(raw_line);
    if (line.empty() || line.front() == '#' || line.front() == ';') {
      continue;
    }

    std::smatch match;
    if (std::regex_match(line, match, kSectionHeader)) {
      current_group = match[1].str();
      current_section = match[2].matched ? match[2].str() : "hosts";
      EnsureGroup(groups, *current_group);
      continue;
    }

    if (!current_group) {
      continue;
    }

    if (current_section == "hosts") {
      EnsureGroup(groups, *current_group).hosts.push_back(FirstToken(line));
    } else if (current_section == "children") {
      EnsureGroup(groups, FirstToken(line));
    }
  }

  return groups;
}

} // namespace ansiviz
