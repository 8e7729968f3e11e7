#ifndef HITL_CONFIG_CONFIG_H
#define HITL_CONFIG_CONFIG_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "hitl/core/compat.h"
#include "hitl/logging/log_level.h"

/**
 * @file config.h
 * @brief Runtime configuration for login and proxy sessions
 *
 * Sources are layered: built-in defaults, then an optional YAML file, then
 * HITL_* environment variables, then command-line overrides applied by the
 * caller.
 */

namespace hitl {
namespace config {

/**
 * @brief How the proxy treats the reply of a sensitive tool
 */
enum class SensitiveReply {
  DECRYPT,      // result carries an envelope from the device
  ACKNOWLEDGE   // result is discarded, a fixed confirmation is returned
};

struct SensitiveTool {
  std::string name;
  SensitiveReply reply{SensitiveReply::DECRYPT};
  std::string acknowledgement;
};

struct RetrySettings {
  int max_retries = 3;
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{16000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds jitter{500};
};

struct Config {
  std::string backend_url = "http://127.0.0.1:8000";
  std::string config_dir;  // empty until resolved, see defaultConfigDir()
  std::string agent_name = "default";
  std::vector<std::string> scopes{"openid", "profile", "email"};

  // Loopback callback
  std::string callback_host = "127.0.0.1";
  uint16_t callback_port = 0;  // 0 = ephemeral
  std::string callback_path = "/callback";
  std::chrono::seconds callback_timeout{300};

  std::chrono::seconds refresh_skew{60};
  std::chrono::seconds default_token_lifetime{3600};

  std::chrono::seconds connect_timeout{10};
  std::chrono::seconds request_timeout{30};
  std::chrono::seconds relay_call_timeout{600};
  RetrySettings retry;

  std::chrono::seconds device_key_ttl{60};
  size_t worker_threads = 4;

  std::vector<SensitiveTool> sensitive_tools{
      {"request_human_input", SensitiveReply::DECRYPT, ""},
      {"notify_human", SensitiveReply::ACKNOWLEDGE,
       "Notification sent successfully"},
      {"notify_human_completion", SensitiveReply::DECRYPT, ""}};

  logging::LogLevel log_level = logging::LogLevel::Info;
  logging::LogFormat log_format = logging::LogFormat::Text;
  std::string log_file;

  // HITL_API_KEY; when set it is used instead of any stored login
  std::string api_key;

  const SensitiveTool* findSensitiveTool(const std::string& name) const;

  std::string endpoint(const std::string& path) const;
  std::string relayUrl() const;

  std::string clientFile() const;
  std::string tokenFile() const;
  std::string keyFile() const;
  std::string legacyTokenFile() const;
};

// ~/.config/hitl-cli, honoring $XDG_CONFIG_HOME
std::string defaultConfigDir();

/**
 * @brief Load configuration
 * @param path YAML file; empty means "<config_dir>/config.yaml" if present
 * @throws HitlError(CONFIGURATION_ERROR) on unreadable or invalid input
 */
Config loadConfig(const std::string& path = "");

// Merges a YAML document into an existing Config
void applyYaml(Config& config, const std::string& yaml_text);

// Applies HITL_BACKEND_URL, HITL_CONFIG_DIR, HITL_LOG_LEVEL, HITL_LOG_FORMAT,
// HITL_AGENT_NAME and HITL_API_KEY
void applyEnvironment(Config& config);

// Case-insensitive; throws HitlError(CONFIGURATION_ERROR) for unknown names
logging::LogLevel parseLogLevel(const std::string& name);

// "text" or "json", case-insensitive
logging::LogFormat parseLogFormat(const std::string& name);

// Throws HitlError(CONFIGURATION_ERROR) when a field is out of range
void validate(const Config& config);

}  // namespace config
}  // namespace hitl

#endif  // HITL_CONFIG_CONFIG_H
