#include <ansiviz/logging.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  ansiviz::StructuredLogger logger(stream, {ansiviz::LogLevel::kInfo});

  logger.Log(ansiviz::LogLevel::kDebug, "debug message", {});
  logger.Log(ansiviz::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  ansiviz::StructuredLogger logger(stream, {ansiviz::LogLevel::kDebug});

  logger.Log(ansiviz::LogLevel::kDebug, "playbook.parsed",
             {{"path", "site.yml"}, {"plays", "2"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"path\": \"site.yml\""));
  EXPECT_NE(std::string::npos, output.find("\"plays\": \"2\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"playbook.parsed\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = ansiviz::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr,
            std::dynamic_pointer_cast<ansiviz::NullLogger>(provided));

  auto custom = std::make_shared<ansiviz::StructuredLogger>(
      std::cout, ansiviz::LoggingConfig{});
  EXPECT_EQ(custom, ansiviz::EnsureLogger(custom));
}

TEST(DiagnosticsLoggerTest, RecordsWarningsAndErrorsOnly) {
  ansiviz::DiagnosticsLogger logger;

  logger.Log(ansiviz::LogLevel::kDebug, "playbook.skipped", {});
  logger.Log(ansiviz::LogLevel::kInfo, "roles.resolved", {{"count", "1"}});
  logger.Log(ansiviz::LogLevel::kWarn, "role.tasks.missing",
             {{"role", "web"}});
  logger.Log(ansiviz::LogLevel::kError, "include.unreadable", {});

  EXPECT_THAT(logger.Diagnostics(),
              ElementsAre("warn: role.tasks.missing {\"role\": \"web\"}",
                          "error: include.unreadable"));
}

TEST(DiagnosticsLoggerTest, ForwardsEveryMessageToWrappedLogger) {
  std::stringstream stream;
  auto next = std::make_shared<ansiviz::StructuredLogger>(
      stream, ansiviz::LoggingConfig{ansiviz::LogLevel::kDebug});
  ansiviz::DiagnosticsLogger logger(next);

  logger.Log(ansiviz::LogLevel::kDebug, "playbook.skipped", {});
  logger.Log(ansiviz::LogLevel::kWarn, "playbook.empty", {});

  EXPECT_EQ(ansiviz::LogLevel::kDebug, logger.Level());
  EXPECT_THAT(stream.str(), HasSubstr("playbook.skipped"));
  EXPECT_THAT(stream.str(), HasSubstr("playbook.empty"));
  EXPECT_EQ(1u, logger.Diagnostics().size());
}

} // namespace
