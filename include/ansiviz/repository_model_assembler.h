#pragma once

#include <ansiviz/interfaces.h>
#include <ansiviz/logging.h>

#include <memory>

namespace ansiviz {

// Parses inventories, playbooks (following import_playbook) and the roles they
// reach into one RepositoryModel. Soft misses end up in
// RepositoryModel::diagnostics; FormatError and MissingResourceError
// propagate.
class RepositoryModelAssembler : public ModelBuilder {
public:
  explicit RepositoryModelAssembler(std::shared_ptr<Logger> logger = nullptr);

  RepositoryModel Build(const GenerationRequest &request) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace ansiviz
