#include "logger.h"
#include <mutex>
#include <ctime>
#include <cstdio>
#include <unistd.h>
#include <fcntl.h>

namespace PeckLogger {

namespace {

Level DefaultLevel() {
#ifdef PECK_DEBUG_BUILD
  return DEBUG;
#else
  return INFO;
#endif
}

std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}

// File sink, -1 when logging to stderr only
int log_fd = -1;

void CloseLogFileLocked() {
  if (log_fd >= 0) {
    close(log_fd);
    log_fd = -1;
  }
}

// Write the whole buffer, retrying on short writes
void WriteAll(int fd, const std::string& data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t written = write(fd, data.data() + offset, data.size() - offset);
    if (written <= 0) {
      return;
    }
    offset += static_cast<size_t>(written);
  }
}

}  // namespace

Level Logger::current_level_ = DefaultLevel();

void Logger::Init() {
  current_level_ = DefaultLevel();
}

bool Logger::Init(const std::string& log_file_path) {
  Init();

  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);

  std::lock_guard<std::mutex> lock(LogMutex());
  CloseLogFileLocked();
  if (fd < 0) {
    std::cerr << FormatLine(ERROR, "Logger", "Cannot open log file " + log_file_path) << "\n";
    return false;
  }
  log_fd = fd;
  return true;
}

void Logger::Shutdown() {
  std::lock_guard<std::mutex> lock(LogMutex());
  CloseLogFileLocked();
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

const char* Logger::LevelName(Level level) {
  static const char* const kNames[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
  if (level < DEBUG || level > ERROR) {
    return "?????";
  }
  return kNames[level];
}

std::string Logger::FormatLine(Level level, const std::string& component,
                               const std::string& message) {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000);

  std::tm local;
  localtime_r(&seconds, &local);

  char stamp[16];
  snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03ld",
           local.tm_hour, local.tm_min, local.tm_sec, millis);

  std::string line;
  line.reserve(32 + component.size() + message.size());
  line += "[";
  line += stamp;
  line += "] [";
  line += LevelName(level);
  line += "] [";
  line += component;
  line += "] ";
  line += message;
  return line;
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::string line = FormatLine(level, component, message);
  line += '\n';

  std::lock_guard<std::mutex> lock(LogMutex());
  std::cerr << line;
  if (log_fd >= 0) {
    WriteAll(log_fd, line);
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace PeckLogger
