#include <ansiviz/generation_pipeline_builder.h>

#include <ansiviz/default_generation_pipeline.h>
#include <ansiviz/repository_model_assembler.h>

#include <utility>

namespace ansiviz {

GenerationPipelineBuilder::GenerationPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry), renderer_name_(registry.DefaultRendererName()) {}

GenerationPipelineBuilder &GenerationPipelineBuilder::WithModelBuilder(
    std::unique_ptr<ModelBuilder> model_builder) {
  components_.model_builder = std::move(model_builder);
  return *this;
}

GenerationPipelineBuilder &GenerationPipelineBuilder::WithRenderer(
    std::unique_ptr<DiagramRenderer> renderer) {
  components_.renderer = std::move(renderer);
  return *this;
}

GenerationPipelineBuilder &
GenerationPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

GenerationPipelineBuilder &
GenerationPipelineBuilder::WithRendererName(std::string name) {
  renderer_name_ = std::move(name);
  return *this;
}

DefaultGenerationPipeline GenerationPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.model_builder =
      components_.model_builder
          ? std::move(components_.model_builder)
          : std::make_unique<RepositoryModelAssembler>(components_.logger);
  components_.renderer = components_.renderer
                             ? std::move(components_.renderer)
                             : registry_->CreateRenderer(renderer_name_);
  return DefaultGenerationPipeline(std::move(components_));
}

} // namespace ansiviz
