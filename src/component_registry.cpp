#include <ansiviz/component_registry.h>

#include <ansiviz/mermaid_renderer.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultRenderer[] = "mermaid";

} // namespace

namespace ansiviz {

void ComponentRegistry::RegisterRenderer(const std::string &name,
                                         RendererFactory factory,
                                         bool set_as_default) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (renderers_.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  renderers_.emplace(name, std::move(factory));
  if (set_as_default || default_renderer_.empty()) {
    default_renderer_ = name;
  }
}

std::unique_ptr<DiagramRenderer>
ComponentRegistry::CreateRenderer(const std::string &name) const {
  const auto target_name = name.empty() ? default_renderer_ : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default renderer registered");
  }
  const auto found = renderers_.find(target_name);
  if (found == renderers_.end()) {
    throw std::invalid_argument("Unknown renderer '" + target_name +
                                "'. Registered: " + JoinRendererNames());
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for renderer '" + target_name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string> ComponentRegistry::RendererNames() const {
  std::vector<std::string> names;
  names.reserve(renderers_.size());
  for (const auto &entry : renderers_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string ComponentRegistry::JoinRendererNames() const {
  const auto names = RendererNames();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

const std::string &ComponentRegistry::DefaultRendererName() const {
  return default_renderer_;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterRenderer(
      kDefaultRenderer,
      []() { return std::make_unique<MermaidDiagramRenderer>(); }, true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace ansiviz
