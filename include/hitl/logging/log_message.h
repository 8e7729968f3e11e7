#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "hitl/logging/log_level.h"

namespace hitl {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Correlation id of the proxy exchange, if any
  std::string request_id;
  std::string tool_name;

  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context attached to a log call from exchange-scoped code
class LogContext {
 public:
  std::string request_id;
  std::string tool_name;
  Component component{Component::Root};
  std::map<std::string, std::string> metadata;

  void setLocation(const char* file, int line, const char* func) {
    source_file_ = file;
    source_line_ = line;
    source_function_ = func;
  }

  LogMessage toLogMessage(LogLevel level, const std::string& text) const {
    LogMessage msg;
    msg.level = level;
    msg.message = text;
    msg.component = component;
    msg.file = source_file_;
    msg.line = source_line_;
    msg.function = source_function_;
    msg.request_id = request_id;
    msg.tool_name = tool_name;
    msg.key_values = metadata;
    return msg;
  }

 private:
  const char* source_file_{nullptr};
  int source_line_{0};
  const char* source_function_{nullptr};
};

}  // namespace logging
}  // namespace hitl
