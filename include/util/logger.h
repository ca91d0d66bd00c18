#ifndef INK_LOGGER_H_
#define INK_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace InkLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to a log file
  static void SetLevel(Level level);
  static Level GetLevel();
  static void Log(Level level, const std::string& component, const std::string& message);

  // Maps "debug", "info", "warn"/"warning", "error" (any case). Unknown
  // names leave `fallback` untouched.
  static Level ParseLevel(const std::string& name, Level fallback);

  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace InkLogger

// LOG_DEBUG only compiles in debug builds
#ifdef INK_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) InkLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) InkLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) InkLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) InkLogger::Logger::Error(component, msg)

#endif  // INK_LOGGER_H_
