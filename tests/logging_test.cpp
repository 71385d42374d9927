#include <solid/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  solid::StructuredLogger logger(stream, {solid::LogLevel::kInfo});

  logger.Log(solid::LogLevel::kDebug, "debug message", {});
  logger.Log(solid::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  solid::StructuredLogger logger(stream, {solid::LogLevel::kDebug});

  logger.Log(solid::LogLevel::kDebug, "rule.complete",
             {{"rule", "lsp"}, {"findings", "2"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"rule\": \"lsp\""));
  EXPECT_NE(std::string::npos, output.find("\"findings\": \"2\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"rule.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = solid::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<solid::NullLogger>(provided));

  auto custom = std::make_shared<solid::StructuredLogger>(
      std::cout, solid::LoggingConfig{});
  EXPECT_EQ(custom, solid::EnsureLogger(custom));
}

TEST(LoggingTest, StageTimerLogsStageWithExtraFields) {
  std::stringstream stream;
  auto logger = solid::MakeLogger({solid::LogLevel::kDebug}, stream);

  {
    solid::StageTimer timer(logger, "read");
    timer.AddField("types", "3");
  }

  const auto output = stream.str();
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
  EXPECT_NE(std::string::npos, output.find("\"stage\": \"read\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_us\": "));
  EXPECT_NE(std::string::npos, output.find("\"types\": \"3\""));
}

TEST(LoggingTest, StageTimerIsSilentBelowDebug) {
  std::stringstream stream;
  auto logger = solid::MakeLogger({solid::LogLevel::kInfo}, stream);

  { solid::StageTimer timer(logger, "render"); }

  EXPECT_TRUE(stream.str().empty());
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(solid::LogLevel::kWarn, solid::ParseLogLevel("WARNING"));
  EXPECT_EQ(solid::LogLevel::kDebug, solid::ParseLogLevel(" debug "));
  EXPECT_EQ("warn", solid::LogLevelName(solid::LogLevel::kWarn));
  EXPECT_THROW(solid::ParseLogLevel("loud"), std::invalid_argument);
}

} // namespace
