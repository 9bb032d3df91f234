#include <bundler/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  bundler::StructuredLogger logger(stream, {bundler::LogLevel::kInfo});

  logger.Log(bundler::LogLevel::kDebug, "debug message", {});
  logger.Log(bundler::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  bundler::StructuredLogger logger(stream, {bundler::LogLevel::kDebug});

  logger.Log(bundler::LogLevel::kDebug, "stage.complete",
             {{"stage", "frontend build"}, {"status", "exit status 0"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos,
            output.find("fields={\"stage\": \"frontend build\""));
  EXPECT_NE(std::string::npos, output.find("\"status\": \"exit status 0\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"stage.complete\""));
}

TEST(LoggingTest, ConsoleLoggerPrefixesByLevel) {
  std::stringstream stream;
  bundler::ConsoleLogger logger(stream, {bundler::LogLevel::kDebug});

  logger.Log(bundler::LogLevel::kInfo, "Building frontend (vite)",
             {{"reason", "forced"}});
  logger.Log(bundler::LogLevel::kWarn, "No suitable icon source file found");
  logger.Log(bundler::LogLevel::kDebug, "env HOME=/tmp");
  logger.Log(bundler::LogLevel::kError, "Task failed");

  EXPECT_EQ("==> Building frontend (vite) (reason=forced)\n"
            "warning: No suitable icon source file found\n"
            "[verbose] env HOME=/tmp\n"
            "ERROR: Task failed\n",
            stream.str());
}

TEST(LoggingTest, ConsoleLoggerColorsOnlyWhenEnabled) {
  std::stringstream plain;
  bundler::ConsoleLogger plain_logger(plain, {bundler::LogLevel::kInfo});
  plain_logger.Log(bundler::LogLevel::kInfo, "Icon ready", {});
  EXPECT_EQ(std::string::npos, plain.str().find('\x1b'));

  std::stringstream colored;
  bundler::LoggingConfig config;
  config.color = true;
  bundler::ConsoleLogger colored_logger(colored, config);
  colored_logger.Log(bundler::LogLevel::kInfo, "Icon ready", {});
  EXPECT_NE(std::string::npos, colored.str().find('\x1b'));
  EXPECT_NE(std::string::npos, colored.str().find("Icon ready"));
}

TEST(LoggingTest, ConsoleLoggerHidesDebugAtInfoLevel) {
  std::stringstream stream;
  bundler::ConsoleLogger logger(stream, {bundler::LogLevel::kInfo});

  logger.Log(bundler::LogLevel::kDebug, "Staleness decision", {});

  EXPECT_TRUE(stream.str().empty());
}

TEST(LoggingTest, MakeLoggerSelectsFormat) {
  std::stringstream stream;
  bundler::LoggingConfig config;
  config.format = bundler::LogFormat::kStructured;
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<bundler::StructuredLogger>(
                         bundler::MakeLogger(config, stream)));

  config.format = bundler::LogFormat::kConsole;
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<bundler::ConsoleLogger>(
                         bundler::MakeLogger(config, stream)));
}

TEST(LoggingTest, StringStreamIsNeverATerminal) {
  std::stringstream stream;
  EXPECT_FALSE(bundler::IsTerminal(stream));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = bundler::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr,
            std::dynamic_pointer_cast<bundler::NullLogger>(provided));

  auto custom = std::make_shared<bundler::StructuredLogger>(
      std::cout, bundler::LoggingConfig{});
  EXPECT_EQ(custom, bundler::EnsureLogger(custom));
}

} // namespace
