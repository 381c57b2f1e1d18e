#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace ansiviz {

// Loads a whole YAML file. Throws MissingResourceError when the file cannot be
// opened and FormatError on a syntax error.
YAML::Node LoadYamlDocument(const std::filesystem::path &path);

bool IsTruthy(const YAML::Node &node);

std::string ScalarText(const YAML::Node &node);

std::vector<std::string> ToStringList(const YAML::Node &node);

std::string NameOf(const YAML::Node &node,
                   std::initializer_list<const char *> keys);

} // namespace ansiviz
