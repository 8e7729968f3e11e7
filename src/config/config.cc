#define HITL_LOG_COMPONENT "config"

#include "hitl/config/config.h"

#include <sys/stat.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "hitl/core/error.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace config {

namespace {

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool isKnownLevel(const std::string& name) {
  static const char* kLevels[] = {"debug",    "info",  "notice",
                                  "warning",  "error", "critical",
                                  "alert",    "emergency", "off"};
  std::string lower;
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (const char* level : kLevels) {
    if (lower == level) {
      return true;
    }
  }
  return false;
}

logging::LogLevel parseLevel(const std::string& name) {
  if (!isKnownLevel(name)) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    "Unknown log level: " + name);
  }
  std::string lower;
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return logging::stringToLogLevel(lower);
}

logging::LogFormat parseFormat(const std::string& name) {
  std::string lower;
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "text") {
    return logging::LogFormat::Text;
  }
  if (lower == "json") {
    return logging::LogFormat::Json;
  }
  throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                  "Unknown log format: " + name);
}

std::string stripTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

template <typename T>
void readScalar(const YAML::Node& node, const char* key, T& out) {
  if (node[key]) {
    out = node[key].as<T>();
  }
}

void readSeconds(const YAML::Node& node,
                 const char* key,
                 std::chrono::seconds& out) {
  if (node[key]) {
    out = std::chrono::seconds(node[key].as<int64_t>());
  }
}

void readMillis(const YAML::Node& node,
                const char* key,
                std::chrono::milliseconds& out) {
  if (node[key]) {
    out = std::chrono::milliseconds(node[key].as<int64_t>());
  }
}

SensitiveTool parseSensitiveTool(const YAML::Node& node) {
  SensitiveTool tool;
  if (node.IsScalar()) {
    tool.name = node.as<std::string>();
    return tool;
  }
  tool.name = node["name"].as<std::string>("");
  std::string reply = node["reply"].as<std::string>("decrypt");
  if (reply == "decrypt") {
    tool.reply = SensitiveReply::DECRYPT;
  } else if (reply == "acknowledge") {
    tool.reply = SensitiveReply::ACKNOWLEDGE;
    tool.acknowledgement =
        node["acknowledgement"].as<std::string>("Notification sent successfully");
  } else {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    "Unknown reply mode for tool " + tool.name + ": " + reply);
  }
  return tool;
}

}  // namespace

const SensitiveTool* Config::findSensitiveTool(const std::string& name) const {
  for (const auto& tool : sensitive_tools) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

std::string Config::endpoint(const std::string& path) const {
  return stripTrailingSlash(backend_url) + path;
}

std::string Config::relayUrl() const { return endpoint("/mcp-server/mcp/"); }

std::string Config::clientFile() const {
  return config_dir + "/oauth_client.json";
}

std::string Config::tokenFile() const {
  return config_dir + "/oauth_token.json";
}

std::string Config::keyFile() const { return config_dir + "/agent.key"; }

std::string Config::legacyTokenFile() const {
  return config_dir + "/token.json";
}

std::string defaultConfigDir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::string(xdg) + "/hitl-cli";
  }
  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    "HOME is not set; pass --config-dir or HITL_CONFIG_DIR");
  }
  return std::string(home) + "/.config/hitl-cli";
}

void applyYaml(Config& config, const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw HitlError(ErrorCode::CONFIGURATION_ERROR, error.str());
  }

  if (root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    "Configuration root must be a mapping");
  }

  try {
    readScalar(root, "backend_url", config.backend_url);
    readScalar(root, "config_dir", config.config_dir);
    readScalar(root, "agent_name", config.agent_name);
    if (root["scopes"]) {
      config.scopes = root["scopes"].as<std::vector<std::string>>();
    }

    if (auto callback = root["callback"]) {
      readScalar(callback, "host", config.callback_host);
      readScalar(callback, "port", config.callback_port);
      readScalar(callback, "path", config.callback_path);
      readSeconds(callback, "timeout_seconds", config.callback_timeout);
    }

    if (auto tokens = root["tokens"]) {
      readSeconds(tokens, "refresh_skew_seconds", config.refresh_skew);
      readSeconds(tokens, "default_lifetime_seconds",
                  config.default_token_lifetime);
    }

    if (auto http = root["http"]) {
      readSeconds(http, "connect_timeout_seconds", config.connect_timeout);
      readSeconds(http, "request_timeout_seconds", config.request_timeout);
      readSeconds(http, "relay_call_timeout_seconds",
                  config.relay_call_timeout);
      if (auto retry = http["retry"]) {
        readScalar(retry, "max_retries", config.retry.max_retries);
        readMillis(retry, "initial_delay_ms", config.retry.initial_delay);
        readMillis(retry, "max_delay_ms", config.retry.max_delay);
        readScalar(retry, "backoff_multiplier",
                   config.retry.backoff_multiplier);
        readMillis(retry, "jitter_ms", config.retry.jitter);
      }
    }

    if (auto proxy = root["proxy"]) {
      readScalar(proxy, "worker_threads", config.worker_threads);
      readSeconds(proxy, "device_key_ttl_seconds", config.device_key_ttl);
      if (auto tools = proxy["sensitive_tools"]) {
        if (!tools.IsSequence()) {
          throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                          "proxy.sensitive_tools must be a sequence");
        }
        config.sensitive_tools.clear();
        for (const auto& tool : tools) {
          config.sensitive_tools.push_back(parseSensitiveTool(tool));
        }
      }
    }

    if (auto log = root["logging"]) {
      if (log["level"]) {
        config.log_level = parseLevel(log["level"].as<std::string>());
      }
      if (log["format"]) {
        config.log_format = parseFormat(log["format"].as<std::string>());
      }
      readScalar(log, "file", config.log_file);
    }
  } catch (const YAML::Exception& e) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    std::string("Invalid configuration value: ") + e.what());
  }
}

void applyEnvironment(Config& config) {
  if (const char* value = std::getenv("HITL_BACKEND_URL")) {
    config.backend_url = value;
  }
  if (const char* value = std::getenv("HITL_CONFIG_DIR")) {
    config.config_dir = value;
  }
  if (const char* value = std::getenv("HITL_LOG_LEVEL")) {
    config.log_level = parseLevel(value);
  }
  if (const char* value = std::getenv("HITL_LOG_FORMAT")) {
    config.log_format = parseFormat(value);
  }
  if (const char* value = std::getenv("HITL_AGENT_NAME")) {
    config.agent_name = value;
  }
  if (const char* value = std::getenv("HITL_API_KEY")) {
    config.api_key = value;
  }
}

void validate(const Config& config) {
  auto fail = [](const std::string& message) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR, message);
  };

  if (config.backend_url.compare(0, 7, "http://") != 0 &&
      config.backend_url.compare(0, 8, "https://") != 0) {
    fail("backend_url must be an http(s) URL: " + config.backend_url);
  }
  if (config.config_dir.empty()) {
    fail("config_dir is empty");
  }
  if (config.agent_name.empty()) {
    fail("agent_name is empty");
  }
  if (config.callback_path.empty() || config.callback_path[0] != '/') {
    fail("callback.path must start with '/'");
  }
  if (config.callback_timeout < std::chrono::seconds(60)) {
    fail("callback.timeout_seconds must be at least 60");
  }
  if (config.refresh_skew.count() < 0) {
    fail("tokens.refresh_skew_seconds must not be negative");
  }
  if (config.default_token_lifetime.count() <= 0) {
    fail("tokens.default_lifetime_seconds must be positive");
  }
  if (config.retry.max_retries < 0 || config.retry.backoff_multiplier < 1.0) {
    fail("http.retry is out of range");
  }
  if (config.worker_threads == 0) {
    fail("proxy.worker_threads must be at least 1");
  }
  for (const auto& tool : config.sensitive_tools) {
    if (tool.name.empty()) {
      fail("proxy.sensitive_tools entry without name");
    }
  }
}

logging::LogLevel parseLogLevel(const std::string& name) {
  return parseLevel(name);
}

logging::LogFormat parseLogFormat(const std::string& name) {
  return parseFormat(name);
}

Config loadConfig(const std::string& path) {
  Config config;

  // The config directory decides where the default file lives
  if (const char* dir = std::getenv("HITL_CONFIG_DIR")) {
    config.config_dir = dir;
  }
  if (config.config_dir.empty()) {
    config.config_dir = defaultConfigDir();
  }

  std::string file = path;
  if (file.empty()) {
    std::string candidate = config.config_dir + "/config.yaml";
    if (fileExists(candidate)) {
      file = candidate;
    }
  }

  if (!file.empty()) {
    std::ifstream in(file);
    if (!in) {
      throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                      "Cannot read configuration file: " + file);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    applyYaml(config, buffer.str());
    HITL_LOG(Debug, "Loaded configuration from {}", file);
  }

  applyEnvironment(config);
  validate(config);
  return config;
}

}  // namespace config
}  // namespace hitl
