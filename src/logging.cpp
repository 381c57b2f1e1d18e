#include <ansiviz/logging.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace ansiviz {
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
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z");
  return stream.str();
}
} // namespace

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

DiagnosticsLogger::DiagnosticsLogger(std::shared_ptr<Logger> next)
    : next_(EnsureLogger(std::move(next))) {}

void DiagnosticsLogger::Log(LogLevel level, std::string_view message,
                            LogFields fields) {
  if (level == LogLevel::kError || level == LogLevel::kWarn) {
    std::string diagnostic = LevelName(level) + ": " + std::string(message);
    if (!fields.empty()) {
      diagnostic += " " + FormatFields(fields);
    }
    diagnostics_.push_back(std::move(diagnostic));
  }
  next_->Log(level, message, std::move(fields));
}

LogLevel DiagnosticsLogger::Level() const { return next_->Level(); }

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger) {
  if (!logger) {
    return std::make_shared<NullLogger>();
  }
  return logger;
}

std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream) {
  return std::make_shared<StructuredLogger>(stream, config);
}

} // namespace ansiviz
