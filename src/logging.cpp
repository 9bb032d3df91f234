#include <bundler/logging.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>

#include <unistd.h>

namespace bundler {
namespace {
std::string LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::kError:
    return "error";
  case LogLevel::kWarn:
    return "warn";
  case LogLevel::kInfo:
    return "info";
  case LogLevel::kDebug:
    return "debug";
  }
  return "unknown";
}

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
  localtime_r(&time, &tm);
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z");
  return stream.str();
}

std::string FormatFields(const LogFields &fields) {
  if (fields.empty()) {
    return "{}";
  }
  std::ostringstream stream;
  stream << "{";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << '"' << fields[i].first << '"' << ": " << '"'
           << fields[i].second << '"';
  }
  stream << "}";
  return stream.str();
}

std::string FormatConsoleFields(const LogFields &fields) {
  if (fields.empty()) {
    return "";
  }
  std::ostringstream stream;
  stream << " (";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << fields[i].first << '=' << fields[i].second;
  }
  stream << ")";
  return stream.str();
}

constexpr const char *kRed = "\x1b[0;31m";
constexpr const char *kYellow = "\x1b[1;33m";
constexpr const char *kBlue = "\x1b[0;34m";
constexpr const char *kGreen = "\x1b[0;32m";
constexpr const char *kReset = "\x1b[0m";
} // namespace

StructuredLogger::StructuredLogger(std::ostream &stream, LoggingConfig config)
    : stream_(&stream), config_(config) {}

void StructuredLogger::Log(LogLevel level, std::string_view message,
                           LogFields fields) {
  if (!IsEnabled(level) || stream_ == nullptr) {
    return;
  }

  (*stream_) << "[" << Timestamp() << "] level=" << LevelName(level)
             << " message=\"" << message << "\" fields="
             << FormatFields(fields) << "\n";
}

ConsoleLogger::ConsoleLogger(std::ostream &stream, LoggingConfig config)
    : stream_(&stream), config_(config) {}

void ConsoleLogger::Log(LogLevel level, std::string_view message,
                        LogFields fields) {
  if (!IsEnabled(level) || stream_ == nullptr) {
    return;
  }

  const char *color = "";
  std::string prefix;
  switch (level) {
  case LogLevel::kError:
    color = kRed;
    prefix = "ERROR: ";
    break;
  case LogLevel::kWarn:
    color = kYellow;
    prefix = "warning: ";
    break;
  case LogLevel::kInfo:
    color = kGreen;
    prefix = "==> ";
    break;
  case LogLevel::kDebug:
    color = kBlue;
    prefix = "[verbose] ";
    break;
  }

  if (config_.color) {
    (*stream_) << color << prefix << kReset;
  } else {
    (*stream_) << prefix;
  }
  (*stream_) << message << FormatConsoleFields(fields) << "\n";
  stream_->flush();
}

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger) {
  if (!logger) {
    return std::make_shared<NullLogger>();
  }
  return logger;
}

std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream) {
  if (config.format == LogFormat::kStructured) {
    return std::make_shared<StructuredLogger>(stream, config);
  }
  return std::make_shared<ConsoleLogger>(stream, config);
}

bool IsTerminal(std::ostream &stream) {
  if (&stream == &std::cout) {
    return isatty(fileno(stdout)) != 0;
  }
  if (&stream == &std::cerr || &stream == &std::clog) {
    return isatty(fileno(stderr)) != 0;
  }
  return false;
}

} // namespace bundler
