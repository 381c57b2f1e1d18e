#pragma once

#include <ansiviz/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ansiviz {

class ComponentRegistry {
public:
  using RendererFactory = std::function<std::unique_ptr<DiagramRenderer>()>;

  void RegisterRenderer(const std::string &name, RendererFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<DiagramRenderer>
  CreateRenderer(const std::string &name = "") const;

  std::vector<std::string> RendererNames() const;

  const std::string &DefaultRendererName() const;

private:
  std::string JoinRendererNames() const;

  std::unordered_map<std::string, RendererFactory> renderers_;
  std::string default_renderer_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace ansiviz
