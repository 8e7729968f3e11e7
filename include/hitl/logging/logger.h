#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <fmt/format.h>

#include "hitl/logging/log_level.h"
#include "hitl/logging/log_message.h"
#include "hitl/logging/log_sink.h"

namespace hitl {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name)
      : effective_level_(LogLevel::Info), name_(name) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug, render(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info, render(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning, render(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error, render(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* fmt,
                      Args&&... args) {
    if (shouldLog(level)) {
      auto msg =
          ctx.toLogMessage(level, render(fmt, std::forward<Args>(args)...));
      msg.logger_name = name_;
      logMessage(msg);
    }
  }

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = render(fmt, std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= effective_level_.load(std::memory_order_relaxed);
  }

  const std::string& getName() const { return name_; }

  void flush() {
    auto sink = getSink();
    if (sink) {
      sink->flush();
    }
  }

 private:
  template <typename... Args>
  static std::string render(const char* fmt, Args&&... args) {
    return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
  }

  void logImpl(LogLevel level, const std::string& text) {
    LogMessage msg;
    msg.level = level;
    msg.message = text;
    msg.logger_name = name_;
    logMessage(msg);
  }

  void logMessage(const LogMessage& msg) {
    auto sink = getSink();
    if (sink) {
      sink->log(msg);
    }
  }

  std::atomic<LogLevel> effective_level_;
  std::string name_;
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace hitl
