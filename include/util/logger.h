#ifndef PECK_LOGGER_H_
#define PECK_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace PeckLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

// Process-wide logger. Lines go to stderr and, after a successful
// Init(path), to a log file kept open until Shutdown().
class Logger {
public:
  static void Init();
  // Also append to log_file_path. Returns false when the file cannot be
  // opened; stderr logging still works in that case.
  static bool Init(const std::string& log_file_path);
  static void Shutdown();

  static void SetLevel(Level level);
  static Level GetLevel();
  static void Log(Level level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

  // "[HH:MM:SS.mmm] [LEVEL] [component] message", without the newline
  static std::string FormatLine(Level level, const std::string& component,
                                const std::string& message);

private:
  static Level current_level_;
  static const char* LevelName(Level level);
};

} // namespace PeckLogger

// LOG_DEBUG only compiles in debug builds
#ifdef PECK_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) PeckLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) PeckLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) PeckLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) PeckLogger::Logger::Error(component, msg)

#endif  // PECK_LOGGER_H_
