#pragma once

#include <ansiviz/models.h>

#include <exception>

namespace ansiviz {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitDiagnostics = 2;
constexpr int kExitFormatError = 3;
constexpr int kExitMissingResource = 4;

int ExitCodeForError(const std::exception &error);

int GenerationExitCode(const GenerationResult &result, bool fail_on_warnings);

} // namespace ansiviz
