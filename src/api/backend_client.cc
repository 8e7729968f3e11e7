#define HITL_LOG_COMPONENT "http"

#include "hitl/api/backend_client.h"

#include <nlohmann/json.hpp>

#include "hitl/core/error.h"
#include "hitl/crypto/encoding.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace api {

BackendClient::BackendClient(const Context& context) : context_(context) {}

std::vector<crypto::PublicKey> BackendClient::getDevicePublicKeys(
    const http::Authorization& authorization,
    const std::string& agent_name) {
  http::HttpRequest request;
  request.url = context_.config.endpoint("/api/v1/devices/public-keys");
  request.method = http::HttpMethod::GET;
  authorization.applyTo(request);
  request.headers["Accept"] = "application/json";
  if (!agent_name.empty()) {
    request.headers["X-MCP-Agent-Name"] = agent_name;
  }
  request.timeout = context_.config.request_timeout;

  http::HttpResponse response = context_.http->request(request);

  if (response.status_code == 401) {
    throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                    "Backend rejected the credentials");
  }
  if (response.status_code >= 500) {
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Device key lookup failed: HTTP " +
                        std::to_string(response.status_code));
  }
  if (!response.isSuccess()) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Device key lookup failed: HTTP " +
                        std::to_string(response.status_code));
  }

  std::vector<crypto::PublicKey> keys;
  try {
    auto body = nlohmann::json::parse(response.body);
    const nlohmann::json& list =
        body.is_array() ? body : body.at("public_keys");
    for (const auto& entry : list) {
      std::string encoded;
      if (entry.is_string()) {
        encoded = entry.get<std::string>();
      } else if (entry.is_object() && entry.contains("public_key")) {
        encoded = entry["public_key"].get<std::string>();
      }
      auto key = crypto::publicKeyFromBase64(encoded);
      if (key) {
        keys.push_back(*key);
      } else {
        HITL_LOG(Warning, "Skipping malformed device public key");
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    std::string("Malformed device key response: ") + e.what());
  }

  HITL_LOG(Debug, "Backend returned {} device key(s)", keys.size());
  return keys;
}

void BackendClient::registerAgentKey(
    const http::Authorization& authorization,
    const std::string& agent_id,
    const std::string& public_key_base64) {
  nlohmann::json body;
  body["entity_type"] = "agent";
  body["entity_id"] = agent_id;
  body["public_key"] = public_key_base64;

  http::HttpRequest request;
  request.url = context_.config.endpoint("/api/v1/keys/register");
  request.method = http::HttpMethod::POST;
  authorization.applyTo(request);
  request.headers["Content-Type"] = "application/json";
  request.body = body.dump();
  request.timeout = context_.config.request_timeout;

  http::HttpResponse response = context_.http->request(request);
  if (!response.isSuccess()) {
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Key registration failed: HTTP " +
                        std::to_string(response.status_code));
  }
  HITL_LOG(Info, "Registered agent public key for agent {}", agent_id);
}

optional<std::string> BackendClient::agentIdFromToken(const std::string& token) {
  size_t first = token.find('.');
  if (first == std::string::npos) {
    return nullopt;
  }
  size_t second = token.find('.', first + 1);
  if (second == std::string::npos) {
    return nullopt;
  }
  auto payload = crypto::base64UrlDecode(token.substr(first + 1, second - first - 1));
  if (!payload) {
    return nullopt;
  }
  auto claims = nlohmann::json::parse(*payload, nullptr, false);
  if (claims.is_discarded() || !claims.is_object() ||
      !claims.contains("agent_id")) {
    return nullopt;
  }
  const auto& agent_id = claims["agent_id"];
  if (agent_id.is_string()) {
    return agent_id.get<std::string>();
  }
  if (agent_id.is_number_integer()) {
    return std::to_string(agent_id.get<int64_t>());
  }
  return nullopt;
}

}  // namespace api
}  // namespace hitl
