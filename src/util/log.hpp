#ifndef SRC_UTIL_LOG_H_
#define SRC_UTIL_LOG_H_

#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace optray {

enum class LogLevel {
  kDebug,
  kVerbose,
  kInfo,
  kWarning,
  kError,
  kFatal,
};

const char* LogLevelName(LogLevel level);


struct LogMessage {
  LogLevel level;
  std::chrono::system_clock::time_point time;
  const char* source_file;
  int line;
  std::string text;
};


class LogFormatter {
 public:
  virtual ~LogFormatter() = default;
  virtual std::string Format(const LogMessage& msg) const = 0;
};


/**
 * @brief Formats a message as `HH:MM:SS.mmm[LEVEL] text`, optionally followed by ` (file:line)`.
 */
class SimpleLogFormatter : public LogFormatter {
 public:
  std::string Format(const LogMessage& msg) const override;

  void EnableSeverity(bool enable) { enable_severity_ = enable; }
  void EnableSourceLocation(bool enable) { enable_source_location_ = enable; }

 private:
  bool enable_severity_ = true;
  bool enable_source_location_ = false;
};


class LogDestination {
 public:
  virtual ~LogDestination() = default;
  virtual void Write(const LogMessage& msg, const LogFormatter& formatter) = 0;
};

using LogDestPtr = std::shared_ptr<LogDestination>;


/**
 * @brief Writes to a C stream. Stdout() and Stderr() return shared instances, so a logger can tell that
 *        two entries point to the same stream.
 */
class LogFileDest : public LogDestination {
 public:
  explicit LogFileDest(std::FILE* file) : file_(file) {}

  void Write(const LogMessage& msg, const LogFormatter& formatter) override;

  static LogDestPtr Stdout();
  static LogDestPtr Stderr();

 private:
  std::FILE* file_;
};


class LogFilter {
 public:
  virtual ~LogFilter() = default;
  virtual bool Accept(const LogMessage& msg) const = 0;

  // Accept listed levels only. An empty list accepts everything.
  static std::shared_ptr<LogFilter> MakeLevelFilter(std::initializer_list<LogLevel> levels);
  // Accept `min_level` and all levels above it.
  static std::shared_ptr<LogFilter> MakeThresholdFilter(LogLevel min_level);
};

using LogFilterPtr = std::shared_ptr<LogFilter>;


class LogLevelFilter : public LogFilter {
 public:
  explicit LogLevelFilter(std::initializer_list<LogLevel> levels) : levels_{ levels } {}

  bool Accept(const LogMessage& msg) const override;

 private:
  std::vector<LogLevel> levels_;
};


class LogThresholdFilter : public LogFilter {
 public:
  explicit LogThresholdFilter(LogLevel min_level) : min_level_(min_level) {}

  bool Accept(const LogMessage& msg) const override;

 private:
  LogLevel min_level_;
};


/**
 * @brief Process-wide logger.
 *
 * A message is written at most once to each destination, even if several filters routing to it accept
 * the message. By default info goes to stdout and warning / error / fatal go to stderr. Debug and verbose
 * messages are dropped unless the library is built with DEBUG (they go to stderr then), or a destination
 * is added for them.
 */
class Logger {
 public:
  void EmitLog(const char* file, int line, LogLevel level, const char* fmt, ...);
  void EmitLog(const char* file, int line, LogLevel level, std::string msg);

  void AddDestination(LogFilterPtr filter, LogDestPtr dest);
  void RemoveDestination(const LogDestPtr& dest);

  void EnableSourceLocation(bool enable);

  static Logger* GetInstance();

  static constexpr size_t kMaxMessageLength = 1024;

 private:
  Logger();

  std::shared_ptr<SimpleLogFormatter> formatter_;
  std::vector<std::pair<LogFilterPtr, LogDestPtr>> routes_;
};

}  // namespace optray

// Convenience macros for log
#define LOG_DEBUG(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kDebug, (fmt), ##__VA_ARGS__)
#define LOG_VERBOSE(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kVerbose, (fmt), ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kInfo, (fmt), ##__VA_ARGS__)
#define LOG_WARNING(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kWarning, (fmt), ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kError, (fmt), ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
  optray::Logger::GetInstance()->EmitLog(__FILE__, __LINE__, optray::LogLevel::kFatal, (fmt), ##__VA_ARGS__)

#endif  // SRC_UTIL_LOG_H_
