#include "hitl/logging/logger_registry.h"

namespace hitl {
namespace logging {

std::string LogPattern::globToRegex(const std::string& glob) {
  std::string regex;
  for (char c : glob) {
    switch (c) {
      case '*':
        regex += ".*";
        break;
      case '?':
        regex += ".";
        break;
      case '.':
        regex += "\\.";
        break;
      default:
        regex += c;
        break;
    }
  }
  return regex;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() { initializeDefaults(); }

void LoggerRegistry::initializeDefaults() {
  global_level_ = LogLevel::Info;
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[static_cast<int>(component)] = level;
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = sink;
  for (auto& entry : loggers_) {
    entry.second->setSink(sink);
  }
}

bool LoggerRegistry::shouldLog(const std::string& logger_name,
                               LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(logger_name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  return level != LogLevel::Off && level >= getEffectiveLevelLocked(logger_name);
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  // "auth.flow" -> component "auth"
  std::string prefix = name.substr(0, name.find('.'));
  for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
    if (prefix == componentToString(static_cast<Component>(i))) {
      auto level_it = component_levels_.find(i);
      if (level_it != component_levels_.end()) {
        return level_it->second;
      }
      break;
    }
  }

  return global_level_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  component_levels_.clear();
  loggers_.clear();
  initializeDefaults();
}

ComponentLogger::ComponentLogger(Component component, const std::string& name)
    : component_(component) {
  logger_ = LoggerRegistry::instance().getOrCreateLogger(
      getComponentPath(component, name));
}

std::string ComponentLogger::getComponentPath(Component comp,
                                              const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace hitl
