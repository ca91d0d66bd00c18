#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <unistd.h>
#include <fcntl.h>

namespace InkLogger {

#ifdef INK_DEBUG_BUILD
Level Logger::current_level_ = DEBUG;
#else
Level Logger::current_level_ = INFO;
#endif

// Serializes output from the converter threads, the protocol receive loops
// and the browser stderr readers so lines never interleave.
static std::mutex log_mutex;
static std::string log_file_path_global;

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global.clear();
}

void Logger::Init(const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;

  // Opened once up front so a bad path is reported here
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    log_file_path_global.clear();
    return;
  }
  close(fd);
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

Level Logger::ParseLevel(const std::string& name, Level fallback) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") return DEBUG;
  if (lower == "info") return INFO;
  if (lower == "warn" || lower == "warning") return WARN;
  if (lower == "error") return ERROR;
  return fallback;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << log_line;

  // Opened per write with O_APPEND; several processes may share the file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;
      close(fd);
    }
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

} // namespace InkLogger
