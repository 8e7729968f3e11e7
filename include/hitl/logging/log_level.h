#pragma once

#include <cstdint>
#include <string>

namespace hitl {
namespace logging {

// Log levels (RFC-5424 severities)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  Auth,
  Crypto,
  Proxy,
  Http,
  Storage,
  Config,
  Cli,
  Count
};

enum class SinkType { File, Stdio };

// Line format of every sink
enum class LogFormat { Text, Json };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "ALERT" || str == "alert") return LogLevel::Alert;
  if (str == "EMERGENCY" || str == "emergency") return LogLevel::Emergency;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info;  // Default
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "root";
    case Component::Auth: return "auth";
    case Component::Crypto: return "crypto";
    case Component::Proxy: return "proxy";
    case Component::Http: return "http";
    case Component::Storage: return "storage";
    case Component::Config: return "config";
    case Component::Cli: return "cli";
    default: return "unknown";
  }
}

}  // namespace logging
}  // namespace hitl
