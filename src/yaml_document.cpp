#include <ansiviz/yaml_document.h>

#include <ansiviz/errors.h>

#include <fstream>

namespace ansiviz {

YAML::Node LoadYamlDocument(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw MissingResourceError(path.string(), "Failed to open file");
  }
  try {
    return YAML::Load(stream);
  } catch (const YAML::ParserException &ex) {
    throw FormatError(path.string(), ex.what());
  }
}

bool IsTruthy(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return false;
  }
  if (node.IsSequence() || node.IsMap()) {
    return node.size() > 0;
  }
  const auto &text = node.Scalar();
  // Quoted scalars are plain strings.
  if (node.Tag() != "!") {
    bool value = false;
    if (YAML::convert<bool>::decode(node, value)) {
      return value;
    }
  }
  return !text.empty() && text != "0";
}

std::string ScalarText(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return {};
  }
  if (node.IsScalar()) {
    return node.Scalar();
  }
  YAML::Emitter emitter;
  emitter << YAML::Flow << node;
  return emitter.c_str();
}

std::vector<std::string> ToStringList(const YAML::Node &node) {
  std::vector<std::string> values;
  if (!node || node.IsNull() || node.IsMap()) {
    return values;
  }
  if (node.IsSequence()) {
    values.reserve(node.size());
    for (const auto &item : node) {
      values.push_back(ScalarText(item));
    }
    return values;
  }
  values.push_back(node.Scalar());
  return values;
}

std::string NameOf(const YAML::Node &node,
                   std::initializer_list<const char *> keys) {
  if (!node || node.IsNull()) {
    return {};
  }
  if (node.IsMap()) {
    for (const auto *key : keys) {
      const auto value = node[key];
      if (IsTruthy(value)) {
        return ScalarText(value);
      }
    }
    return {};
  }
  return ScalarText(node);
}

} // namespace ansiviz
