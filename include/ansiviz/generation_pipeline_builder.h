#pragma once

#include <ansiviz/component_registry.h>
#include <ansiviz/interfaces.h>
#include <ansiviz/logging.h>

#include <memory>
#include <string>

namespace ansiviz {

class DefaultGenerationPipeline;

struct PipelineComponents {
  std::unique_ptr<ModelBuilder> model_builder;
  std::unique_ptr<DiagramRenderer> renderer;
  std::shared_ptr<Logger> logger;
};

class GenerationPipelineBuilder {
public:
  explicit GenerationPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  GenerationPipelineBuilder &
  WithModelBuilder(std::unique_ptr<ModelBuilder> model_builder);
  GenerationPipelineBuilder &
  WithRenderer(std::unique_ptr<DiagramRenderer> renderer);
  GenerationPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  GenerationPipelineBuilder &WithRendererName(std::string name);

  DefaultGenerationPipeline Build();

private:
  const ComponentRegistry *registry_;
  std::string renderer_name_;
  PipelineComponents components_;
};

} // namespace ansiviz
