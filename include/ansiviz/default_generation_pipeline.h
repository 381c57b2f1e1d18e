#pragma once

#include <ansiviz/generation_pipeline_builder.h>

#include <memory>

namespace ansiviz {

class DefaultGenerationPipeline : public GenerationPipeline {
public:
  explicit DefaultGenerationPipeline(PipelineComponents components);

  GenerationResult Run(const GenerationRequest &request) override;

private:
  std::unique_ptr<ModelBuilder> model_builder_;
  std::unique_ptr<DiagramRenderer> renderer_;
  std::shared_ptr<Logger> logger_;
};

} // namespace ansiviz
