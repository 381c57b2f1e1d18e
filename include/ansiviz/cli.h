#pragma once

#include <ansiviz/logging.h>
#include <ansiviz/models.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ansiviz {

struct GenerateOptions {
  std::optional<std::filesystem::path> root;
  std::vector<std::string> inventories;
  std::vector<std::string> playbooks;
  std::optional<LayoutDirection> layout;
  std::optional<std::filesystem::path> output_file;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> renderer;
  std::optional<LogLevel> log_level;
  std::optional<bool> fail_on_warnings;
  bool show_help = false;
};

GenerateOptions
ParseGenerateArguments(const std::vector<std::string> &arguments);
GenerateOptions ParseConfigFile(const std::filesystem::path &path);
GenerateOptions MergeOptions(const GenerateOptions &config_options,
                             const GenerateOptions &cli_options);
GenerateOptions ResolveGenerateOptions(const GenerateOptions &cli_options);

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

// Relative inventory and playbook paths are anchored at the repository root.
GenerationRequest BuildGenerationRequest(const GenerateOptions &options);

int RunGenerate(const std::vector<std::string> &arguments);

} // namespace ansiviz
