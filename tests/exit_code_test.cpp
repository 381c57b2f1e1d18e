#include <ansiviz/cli_exit_codes.h>
#include <ansiviz/errors.h>
#include <ansiviz/models.h>

#include <gtest/gtest.h>

#include <stdexcept>

namespace ansiviz {
namespace {

TEST(ExitCodesTest, SuccessWithoutDiagnostics) {
  GenerationResult result;

  EXPECT_EQ(0, GenerationExitCode(result, false));
  EXPECT_EQ(0, GenerationExitCode(result, true));
}

TEST(ExitCodesTest, DiagnosticsOnlyFailWhenRequested) {
  GenerationResult result;
  result.model.diagnostics.push_back("warn: role.tasks.missing");

  EXPECT_EQ(0, GenerationExitCode(result, false));
  EXPECT_EQ(2, GenerationExitCode(result, true));
}

TEST(ExitCodesTest, MapsErrorsByType) {
  EXPECT_EQ(3, ExitCodeForError(FormatError("site.yml", "bad indent")));
  EXPECT_EQ(4, ExitCodeForError(
                   MissingResourceError("site.yml", "Playbook not found")));
  EXPECT_EQ(1, ExitCodeForError(std::runtime_error("boom")));
}

TEST(ExitCodesTest, ErrorMessagesNameThePath) {
  const FormatError format("site.yml", "bad indent");
  const MissingResourceError missing("hosts.ini", "Inventory not found");

  EXPECT_STREQ("Invalid YAML in site.yml: bad indent", format.what());
  EXPECT_EQ("site.yml", format.path());
  EXPECT_STREQ("Inventory not found: hosts.ini", missing.what());
  EXPECT_EQ("hosts.ini", missing.path());
}

} // namespace
} // namespace ansiviz
