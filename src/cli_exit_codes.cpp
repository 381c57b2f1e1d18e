#include <ansiviz/cli_exit_codes.h>

#include <ansiviz/errors.h>

namespace ansiviz {

int ExitCodeForError(const std::exception &error) {
  if (dynamic_cast<const FormatError *>(&error) != nullptr) {
    return kExitFormatError;
  }
  if (dynamic_cast<const MissingResourceError *>(&error) != nullptr) {
    return kExitMissingResource;
  }
  return kExitFailure;
}

int GenerationExitCode(const GenerationResult &result, bool fail_on_warnings) {
  if (fail_on_warnings && !result.model.diagnostics.empty()) {
    return kExitDiagnostics;
  }
  return kExitSuccess;
}

} // namespace ansiviz
