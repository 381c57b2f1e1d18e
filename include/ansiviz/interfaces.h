#pragma once

#include <ansiviz/models.h>

#include <string>

namespace ansiviz {

class ModelBuilder {
public:
  virtual ~ModelBuilder() = default;
  virtual RepositoryModel Build(const GenerationRequest &request) = 0;
};

class DiagramRenderer {
public:
  virtual ~DiagramRenderer() = default;
  virtual std::string Render(const RepositoryModel &model,
                             const GenerationRequest &request) = 0;
};

class GenerationPipeline {
public:
  virtual ~GenerationPipeline() = default;
  virtual GenerationResult Run(const GenerationRequest &request) = 0;
};

} // namespace ansiviz
