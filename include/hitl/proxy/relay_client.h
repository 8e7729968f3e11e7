#ifndef HITL_PROXY_RELAY_CLIENT_H
#define HITL_PROXY_RELAY_CLIENT_H

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hitl/context.h"
#include "hitl/core/compat.h"

/**
 * @file relay_client.h
 * @brief JSON-RPC over streamable HTTP to the remote relay
 */

namespace hitl {
namespace proxy {

class RelayClient {
 public:
  RelayClient(const Context& context,
              std::string relay_url,
              std::string agent_name);

  /**
   * @brief POST one JSON-RPC message
   *
   * Both plain JSON and text/event-stream bodies are accepted; for a request
   * the message answering its id is returned.
   * @return nullopt when the relay accepted the message without a body
   * @throws HitlError(REAUTHENTICATION_REQUIRED) on 401
   * @throws HitlError(NETWORK_ERROR) for transport failures and non-JSON-RPC
   *         error statuses
   */
  optional<nlohmann::json> send(const nlohmann::json& message,
                                const http::Authorization& authorization,
                                bool idempotent = false);

  // Messages carried in an SSE body, in order
  static std::vector<nlohmann::json> parseEventStream(const std::string& body);

  std::string sessionId() const;

  const std::string& url() const { return relay_url_; }

 private:
  const Context& context_;
  std::string relay_url_;
  std::string agent_name_;
  mutable std::mutex session_mutex_;
  std::string session_id_;
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_RELAY_CLIENT_H
