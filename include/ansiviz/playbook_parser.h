#pragma once

#include <ansiviz/logging.h>
#include <ansiviz/models.h>
#include <ansiviz/task_extractor.h>

#include <filesystem>
#include <memory>

namespace ansiviz {

class PlaybookParser {
public:
  PlaybookParser(std::filesystem::path repository_root,
                 std::shared_ptr<Logger> logger = nullptr);

  // Throws MissingResourceError for an absent file and FormatError for
  // malformed YAML. Empty or non-list playbooks parse to no plays.
  Playbook Parse(const std::filesystem::path &path);

private:
  Play ParsePlay(const YAML::Node &raw, const std::filesystem::path &path);

  TaskExtractor extractor_;
  std::shared_ptr<Logger> logger_;
};

// Lexically normalized, generic form used as playbook identity.
std::string PlaybookKey(const std::filesystem::path &path);

} // namespace ansiviz
