#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hitl/logging/logger.h"

namespace hitl {
namespace logging {

// Glob pattern ("auth.*") mapped to a level
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob);
};

class LoggerRegistry {
 public:
  // Zero-configuration singleton; logs to stderr at Info until configured
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);

  // Later patterns win over earlier ones
  void setPattern(const std::string& pattern, LogLevel level);

  // Replaces the sink of every logger, existing and future
  void setSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

  // Restores the defaults (tests)
  void reset();

 private:
  LoggerRegistry();

  void initializeDefaults();
  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to a Component; names become "<component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name);

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      LogContext ctx;
      ctx.component = component_;
      logger_->logWithContext(level, ctx, fmt, std::forward<Args>(args)...);
    }
  }

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace hitl
