#include <ansiviz/cli.h>

#include <ansiviz/cli_exit_codes.h>
#include <ansiviz/default_generation_pipeline.h>
#include <ansiviz/generation_pipeline_builder.h>
#include <ansiviz/string_utils.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using ansiviz::GenerateOptions;
using ansiviz::ToLower;
using ansiviz::Trim;

void PrintGenerateUsage() {
  std::cout
      << "Usage: ansiviz generate --root <path> --inventory <list> "
         "--playbook <list> [options]\n"
      << "Options:\n"
      << "  --root <path>         Root directory of the Ansible repository\n"
      << "  --inventory <list>    Comma-separated inventory files (INI or "
         "YAML)\n"
      << "  --playbook <list>     Comma-separated playbook files\n"
      << "  --layout <dir>        Diagram direction (LR,RL,TB,TD,BT; "
         "default: LR)\n"
      << "  --out <file>          Write the diagram to a file instead of "
         "stdout\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --renderer <name>     Diagram renderer plug-in to use\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --fail-on-warnings    Exit with status 2 when diagnostics were "
         "recorded\n"
      << "  --help                Show this message\n";
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

ansiviz::LogLevel ParseLogLevel(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error") {
    return ansiviz::LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return ansiviz::LogLevel::kWarn;
  }
  if (normalized == "info") {
    return ansiviz::LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return ansiviz::LogLevel::kDebug;
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

std::vector<std::string> SplitPathList(const std::string &raw_paths) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_paths) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendRawPathStrings(const std::string &raw_paths,
                          std::vector<std::string> &target) {
  for (auto path_value : SplitPathList(raw_paths)) {
    path_value = Trim(path_value);
    if (path_value.empty()) {
      continue;
    }

    const auto normalized = std::filesystem::path(path_value).generic_string();
    if (std::find(target.begin(), target.end(), normalized) == target.end()) {
      target.push_back(normalized);
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, GenerateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = ansiviz::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = ansiviz::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleInputOption(const std::vector<std::string> &arguments,
                       std::size_t &index, GenerateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--inventory" || argument == "--inventories") {
    AppendRawPathStrings(RequireValue(arguments, index, argument),
                         options.inventories);
    return true;
  }
  if (argument == "--playbook" || argument == "--playbooks") {
    AppendRawPathStrings(RequireValue(arguments, index, argument),
                         options.playbooks);
    return true;
  }
  return false;
}

bool DispatchGenerateOption(const std::vector<std::string> &arguments,
                            std::size_t &index, GenerateOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--layout") {
    options.layout = ansiviz::ParseLayoutDirection(
        Trim(RequireValue(arguments, index, "--layout")));
    return true;
  }
  if (argument == "--out") {
    options.output_file = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--renderer") {
    options.renderer = RequireValue(arguments, index, "--renderer");
    return true;
  }
  if (argument == "--fail-on-warnings") {
    options.fail_on_warnings = true;
    return true;
  }
  return HandleInputOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

void ValidateGenerateOptions(const GenerateOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
  if (options.playbooks.empty()) {
    throw std::invalid_argument(
        "At least one --playbook is required (or set in config file)");
  }
}

void WriteDiagram(const std::optional<std::filesystem::path> &output_file,
                  const std::string &diagram) {
  if (!output_file) {
    std::cout << diagram << "\n";
    return;
  }
  if (output_file->has_parent_path()) {
    std::filesystem::create_directories(output_file->parent_path());
  }
  std::ofstream stream(*output_file);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " +
                             output_file->string());
  }
  stream << diagram << "\n";
}

} // namespace

namespace ansiviz {

GenerateOptions
ParseGenerateArguments(const std::vector<std::string> &arguments) {
  GenerateOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchGenerateOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root",     "inventories", "playbooks", "layout",
      "out",      "renderer",    "log_level", "fail_on_warnings"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"repository", "root"},
      {"repository_root", "root"},
      {"inventory", "inventories"},
      {"playbook", "playbooks"},
      {"output", "out"},
      {"output_file", "out"},
      {"direction", "layout"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractPathList(const YAML::Node &node,
                                         const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      AppendRawPathStrings(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendRawPathStrings(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "inventories" || key == "playbooks") {
    return ExtractPathList(node, key);
  }
  if (key == "fail_on_warnings") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "root" || key == "out" || key == "layout" || key == "renderer" ||
      key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, GenerateOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "root") {
      options.root = std::get<std::string>(value);
      continue;
    }
    if (key == "inventories") {
      options.inventories = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "playbooks") {
      options.playbooks = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "layout") {
      options.layout =
          ParseLayoutDirection(Trim(std::get<std::string>(value)));
      continue;
    }
    if (key == "out") {
      options.output_file = std::get<std::string>(value);
      continue;
    }
    if (key == "renderer") {
      options.renderer = std::get<std::string>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "fail_on_warnings") {
      options.fail_on_warnings = std::get<bool>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

GenerateOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  GenerateOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

GenerateOptions MergeOptions(const GenerateOptions &config_options,
                             const GenerateOptions &cli_options) {
  GenerateOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.layout, cli_options.layout);
  override_value(merged.output_file, cli_options.output_file);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.renderer, cli_options.renderer);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.fail_on_warnings, cli_options.fail_on_warnings);

  if (!cli_options.inventories.empty()) {
    merged.inventories = cli_options.inventories;
  }
  if (!cli_options.playbooks.empty()) {
    merged.playbooks = cli_options.playbooks;
  }
  return merged;
}

GenerateOptions ResolveGenerateOptions(const GenerateOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  GenerateOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateGenerateOptions(merged);
  return merged;
}

GenerationRequest BuildGenerationRequest(const GenerateOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
  const auto root = std::filesystem::weakly_canonical(*options.root);
  const auto anchor = [&root](const std::string &raw) {
    std::filesystem::path path(raw);
    if (!path.is_absolute()) {
      path = root / path;
    }
    return path.lexically_normal().generic_string();
  };

  GenerationRequest request;
  request.repository_root = root.generic_string();
  for (const auto &inventory : options.inventories) {
    request.inventory_paths.push_back(anchor(inventory));
  }
  for (const auto &playbook : options.playbooks) {
    request.playbook_paths.push_back(anchor(playbook));
  }
  request.layout = options.layout.value_or(LayoutDirection::kLeftRight);
  return request;
}

LoggingConfig BuildLoggingConfig(const GenerateOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

int RunGenerate(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseGenerateArguments(arguments);
  if (cli_options.show_help) {
    PrintGenerateUsage();
    return kExitSuccess;
  }

  const auto merged = ResolveGenerateOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  GenerationPipelineBuilder builder;
  builder.WithLogger(logger);
  if (merged.renderer) {
    builder.WithRendererName(*merged.renderer);
  }
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(BuildGenerationRequest(merged));
  WriteDiagram(merged.output_file, result.diagram);
  return GenerationExitCode(result, merged.fail_on_warnings.value_or(false));
}

} // namespace ansiviz
