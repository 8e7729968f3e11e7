#include "hitl/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace hitl {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static std::string threadIdToString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";
  oss << "[T:" << msg.thread_id << "] ";

  if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component) << "] ";
  }

  oss << '[' << msg.logger_name << "] ";

  if (msg.file && msg.line > 0) {
    oss << '[' << msg.file << ':' << msg.line;
    if (msg.function) {
      oss << " " << msg.function << "()";
    }
    oss << "] ";
  }

  if (!msg.request_id.empty()) {
    oss << "[req:" << msg.request_id << "] ";
  }
  if (!msg.tool_name.empty()) {
    oss << "[tool:" << msg.tool_name << "] ";
  }

  oss << msg.message;

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first) oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json j;
  j["timestamp"] = formatTimestamp(msg.timestamp);
  j["level"] = logLevelToString(msg.level);
  j["logger"] = msg.logger_name;
  j["thread"] = threadIdToString(msg.thread_id);
  if (msg.process_id > 0) {
    j["pid"] = msg.process_id;
  }
  if (msg.component != Component::Root) {
    j["component"] = componentToString(msg.component);
  }
  if (msg.file && msg.line > 0) {
    j["file"] = msg.file;
    j["line"] = msg.line;
  }
  if (!msg.request_id.empty()) {
    j["request_id"] = msg.request_id;
  }
  if (!msg.tool_name.empty()) {
    j["tool"] = msg.tool_name;
  }
  j["message"] = msg.message;
  for (const auto& kv : msg.key_values) {
    j["fields"][kv.first] = kv.second;
  }
  // Replace invalid UTF-8 rather than throwing from a log call
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace hitl
