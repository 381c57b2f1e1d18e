#pragma once

#include <ansiviz/logging.h>
#include <ansiviz/models.h>

#include <filesystem>
#include <memory>

namespace ansiviz {

// Reads an Ansible inventory in YAML form, falling back to the INI form when
// the file is not a YAML mapping.
class InventoryParser {
public:
  explicit InventoryParser(std::shared_ptr<Logger> logger = nullptr);

  GroupList Parse(const std::filesystem::path &path) const;

  static GroupList ParseIni(const std::filesystem::path &path);

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace ansiviz
