#include "util/log.hpp"

#include <algorithm>
#include <cstdarg>
#include <ctime>
#include <string_view>

namespace optray {

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kVerbose:
      return "VERBOSE";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kFatal:
      return "FATAL";
  }
  return "";
}


std::string SimpleLogFormatter::Format(const LogMessage& msg) const {
  char time_buf[32]{};
  const auto tt = std::chrono::system_clock::to_time_t(msg.time);
  size_t n = std::strftime(time_buf, sizeof(time_buf), "%T", std::localtime(&tt));
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(msg.time.time_since_epoch()).count() % 1000;
  std::snprintf(time_buf + n, sizeof(time_buf) - n, ".%03d", static_cast<int>(ms));

  std::string s{ time_buf };
  if (enable_severity_) {
    s += "[";
    s += LogLevelName(msg.level);
    s += "]";
  }
  s += " ";
  s += msg.text;
  if (enable_source_location_ && msg.source_file) {
    std::string_view file{ msg.source_file };
    auto pos = file.find_last_of('/');
    if (pos != std::string_view::npos) {
      file.remove_prefix(pos + 1);
    }
    s += " (";
    s += file;
    s += ":" + std::to_string(msg.line) + ")";
  }
  return s;
}


void LogFileDest::Write(const LogMessage& msg, const LogFormatter& formatter) {
  std::fprintf(file_, "%s\n", formatter.Format(msg).c_str());
}


LogDestPtr LogFileDest::Stdout() {
  static LogDestPtr dest = std::make_shared<LogFileDest>(stdout);
  return dest;
}


LogDestPtr LogFileDest::Stderr() {
  static LogDestPtr dest = std::make_shared<LogFileDest>(stderr);
  return dest;
}


LogFilterPtr LogFilter::MakeLevelFilter(std::initializer_list<LogLevel> levels) {
  return std::make_shared<LogLevelFilter>(levels);
}


LogFilterPtr LogFilter::MakeThresholdFilter(LogLevel min_level) {
  return std::make_shared<LogThresholdFilter>(min_level);
}


bool LogLevelFilter::Accept(const LogMessage& msg) const {
  return levels_.empty() || std::find(levels_.begin(), levels_.end(), msg.level) != levels_.end();
}


bool LogThresholdFilter::Accept(const LogMessage& msg) const {
  return static_cast<int>(msg.level) >= static_cast<int>(min_level_);
}


Logger::Logger() : formatter_{ std::make_shared<SimpleLogFormatter>() } {
  routes_.emplace_back(LogFilter::MakeLevelFilter({ LogLevel::kInfo }), LogFileDest::Stdout());
#ifdef DEBUG
  routes_.emplace_back(LogFilter::MakeLevelFilter({ LogLevel::kDebug, LogLevel::kVerbose }), LogFileDest::Stderr());
#endif
  routes_.emplace_back(LogFilter::MakeThresholdFilter(LogLevel::kWarning), LogFileDest::Stderr());
}


void Logger::EmitLog(const char* file, int line, LogLevel level, const char* fmt, ...) {
  char buf[kMaxMessageLength];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, kMaxMessageLength, fmt, args);
  va_end(args);

  EmitLog(file, line, level, std::string(buf));
}


void Logger::EmitLog(const char* file, int line, LogLevel level, std::string msg) {
  LogMessage m{ level, std::chrono::system_clock::now(), file, line, std::move(msg) };

  std::vector<const LogDestination*> written;
  for (const auto& [filter, dest] : routes_) {
    if (!filter->Accept(m) || std::find(written.begin(), written.end(), dest.get()) != written.end()) {
      continue;
    }
    dest->Write(m, *formatter_);
    written.emplace_back(dest.get());
  }
}


void Logger::AddDestination(LogFilterPtr filter, LogDestPtr dest) {
  routes_.emplace_back(std::move(filter), std::move(dest));
}


void Logger::RemoveDestination(const LogDestPtr& dest) {
  routes_.erase(std::remove_if(routes_.begin(), routes_.end(), [&dest](const auto& r) { return r.second == dest; }),
                routes_.end());
}


void Logger::EnableSourceLocation(bool enable) {
  formatter_->EnableSourceLocation(enable);
}


Logger* Logger::GetInstance() {
  static Logger logger;
  return &logger;
}

}  // namespace optray
