#include <ansiviz/default_generation_pipeline.h>

#include <chrono>
#include <string>
#include <utility>

namespace ansiviz {

DefaultGenerationPipeline::DefaultGenerationPipeline(
    PipelineComponents components)
    : model_builder_(std::move(components.model_builder)),
      renderer_(std::move(components.renderer)),
      logger_(EnsureLogger(std::move(components.logger))) {}

GenerationResult
DefaultGenerationPipeline::Run(const GenerationRequest &request) {
  logger_->Log(
      LogLevel::kInfo, "pipeline.start",
      {{"root", request.repository_root},
       {"inventories", std::to_string(request.inventory_paths.size())},
       {"playbooks", std::to_string(request.playbook_paths.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  auto model = model_builder_->Build(request);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "model"},
                {"playbooks", std::to_string(model.playbooks.size())},
                {"roles", std::to_string(model.roles.size())}});

  auto diagram = renderer_->Render(model, request);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "render"},
                {"bytes", std::to_string(diagram.size())}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"diagnostics", std::to_string(model.diagnostics.size())}});

  return GenerationResult{std::move(diagram), std::move(model)};
}

} // namespace ansiviz
