#pragma once

#include <ansiviz/interfaces.h>

#include <string>
#include <vector>

namespace ansiviz {

// Renders a RepositoryModel as a Mermaid flowchart with Inventory, Playbooks
// and Roles subgraphs. Equal models render to byte-identical text.
class MermaidDiagramRenderer : public DiagramRenderer {
public:
  std::string Render(const RepositoryModel &model,
                     const GenerationRequest &request) override;
};

const std::vector<std::string> &MermaidClassDefinitions();

} // namespace ansiviz
