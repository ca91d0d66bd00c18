#pragma once

#include <stdexcept>
#include <string>

namespace ink {

// Error kinds surfaced to callers. The kind tells which phase failed so a
// caller can tell infrastructure failures (process, protocol) apart from
// content failures (navigation, conversion).
enum class ErrorKind {
  PROCESS,              // Browser failed to start, exited unexpectedly, could not be killed
  PROTOCOL_TIMEOUT,     // A command, event or endpoint wait exceeded its bound
  PROTOCOL_CONNECTION,  // Socket closed or faulted while requests were pending
  PROTOCOL_COMMAND,     // The browser answered a command with an error object
  PROTOCOL_FORMAT,      // An inbound message could not be parsed
  CONFIGURATION,        // Invalid directory, argument, size or option combination
  CONVERSION_TIMEOUT,   // The shared conversion countdown expired
  NAVIGATION,           // The browser refused or failed to load the target
  CONVERSION            // Invalid input or missing render output
};

inline const char* ErrorKindToCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PROCESS: return "process";
    case ErrorKind::PROTOCOL_TIMEOUT: return "protocol_timeout";
    case ErrorKind::PROTOCOL_CONNECTION: return "protocol_connection";
    case ErrorKind::PROTOCOL_COMMAND: return "protocol_command";
    case ErrorKind::PROTOCOL_FORMAT: return "protocol_format";
    case ErrorKind::CONFIGURATION: return "configuration";
    case ErrorKind::CONVERSION_TIMEOUT: return "conversion_timeout";
    case ErrorKind::NAVIGATION: return "navigation";
    case ErrorKind::CONVERSION: return "conversion";
    default: return "unknown";
  }
}

inline const char* ErrorKindToMessage(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PROCESS: return "Browser process error";
    case ErrorKind::PROTOCOL_TIMEOUT: return "DevTools protocol timed out";
    case ErrorKind::PROTOCOL_CONNECTION: return "DevTools connection lost";
    case ErrorKind::PROTOCOL_COMMAND: return "DevTools command failed";
    case ErrorKind::PROTOCOL_FORMAT: return "Malformed DevTools message";
    case ErrorKind::CONFIGURATION: return "Invalid configuration";
    case ErrorKind::CONVERSION_TIMEOUT: return "Conversion timed out";
    case ErrorKind::NAVIGATION: return "Navigation failed";
    case ErrorKind::CONVERSION: return "Conversion failed";
    default: return "Unknown error";
  }
}

class InkError : public std::runtime_error {
 public:
  InkError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  const char* code() const { return ErrorKindToCode(kind_); }

 private:
  ErrorKind kind_;
};

class ProcessError : public InkError {
 public:
  explicit ProcessError(const std::string& message)
      : InkError(ErrorKind::PROCESS, message) {}
};

class ProtocolTimeoutError : public InkError {
 public:
  // countdown_expired is true when the shared conversion countdown, not the
  // operation's own timeout, ran out.
  ProtocolTimeoutError(const std::string& message, bool countdown_expired)
      : InkError(ErrorKind::PROTOCOL_TIMEOUT, message),
        countdown_expired_(countdown_expired) {}

  bool countdown_expired() const { return countdown_expired_; }

 private:
  bool countdown_expired_;
};

class ProtocolConnectionError : public InkError {
 public:
  explicit ProtocolConnectionError(const std::string& message)
      : InkError(ErrorKind::PROTOCOL_CONNECTION, message) {}
};

class ProtocolCommandError : public InkError {
 public:
  ProtocolCommandError(const std::string& method, int error_code, const std::string& error_message)
      : InkError(ErrorKind::PROTOCOL_COMMAND,
                 "Command '" + method + "' failed with code " + std::to_string(error_code) +
                 ": " + error_message),
        error_code_(error_code) {}

  int error_code() const { return error_code_; }

 private:
  int error_code_;
};

class ProtocolFormatError : public InkError {
 public:
  explicit ProtocolFormatError(const std::string& message)
      : InkError(ErrorKind::PROTOCOL_FORMAT, message) {}
};

class ConfigurationError : public InkError {
 public:
  explicit ConfigurationError(const std::string& message)
      : InkError(ErrorKind::CONFIGURATION, message) {}
};

class ConversionTimeoutError : public InkError {
 public:
  explicit ConversionTimeoutError(const std::string& message)
      : InkError(ErrorKind::CONVERSION_TIMEOUT, message) {}
};

class NavigationError : public InkError {
 public:
  explicit NavigationError(const std::string& message)
      : InkError(ErrorKind::NAVIGATION, message) {}
};

class ConversionError : public InkError {
 public:
  explicit ConversionError(const std::string& message)
      : InkError(ErrorKind::CONVERSION, message) {}
};

}  // namespace ink
