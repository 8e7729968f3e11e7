#ifndef HITL_PROXY_ENCRYPTING_PROXY_H
#define HITL_PROXY_ENCRYPTING_PROXY_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hitl/api/backend_client.h"
#include "hitl/context.h"
#include "hitl/core/compat.h"
#include "hitl/core/error.h"
#include "hitl/core/memory_cache.h"
#include "hitl/crypto/key_manager.h"
#include "hitl/proxy/credential.h"
#include "hitl/proxy/exchange_tracker.h"
#include "hitl/proxy/relay_client.h"

/**
 * @file encrypting_proxy.h
 * @brief MCP surface for the local client with end-to-end encrypted
 *        human-interaction tools
 */

namespace hitl {
namespace proxy {

// JSON-RPC error codes returned to the local client
namespace rpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int INTERNAL_ERROR = -32603;
constexpr int REAUTHENTICATION_REQUIRED = -32001;
constexpr int ENCRYPTION_FAILURE = -32002;
constexpr int CANCELLED = -32800;

int fromErrorCode(ErrorCode code);
// NETWORK_ERROR for codes without a closer match
ErrorCode toErrorCode(int code);
}  // namespace rpc

nlohmann::json makeErrorResponse(const nlohmann::json& id,
                                 int code,
                                 const std::string& message,
                                 const nlohmann::json& data = nullptr);

class EncryptingProxy {
 public:
  EncryptingProxy(const Context& context,
                  CredentialProvider& credential,
                  RelayClient& relay,
                  api::BackendClient& backend,
                  std::shared_ptr<const crypto::AgentKeyPair> agent_key,
                  std::string agent_name);

  /**
   * @brief Process one line from the local client
   *
   * Blocks for the duration of the call; safe to run concurrently.
   * @return the reply to write back, nullopt for notifications or when the
   *         exchange was cancelled meanwhile
   */
  optional<nlohmann::json> handle(const std::string& line);

  /**
   * @brief Run one tools/call on behalf of the command line
   *
   * Goes through the same path as a client request, so sensitive tools are
   * encrypted end to end.
   * @return text content of the result
   * @throws HitlError carrying the code of an error reply
   */
  std::string callTool(const std::string& name,
                       const nlohmann::json& arguments);

  /**
   * @brief Stop accepting work and cancel every outstanding exchange
   * @return one Cancelled error reply per exchange still awaiting a reply
   */
  std::vector<nlohmann::json> shutdown();

  size_t outstanding() const { return tracker_.outstanding(); }

  bool isShuttingDown() const { return shutting_down_.load(); }

  // tools/list result with *_e2ee tools removed
  static nlohmann::json filterToolList(const nlohmann::json& result);

 private:
  optional<nlohmann::json> dispatch(const nlohmann::json& message);
  optional<nlohmann::json> callSensitiveTool(
      const nlohmann::json& message,
      const config::SensitiveTool& tool);
  optional<nlohmann::json> passThrough(const nlohmann::json& message);

  std::vector<crypto::PublicKey> deviceKeys(
      const http::Authorization& authorization,
      bool force_reload);

  const Context& context_;
  CredentialProvider& credential_;
  RelayClient& relay_;
  api::BackendClient& backend_;
  std::shared_ptr<const crypto::AgentKeyPair> agent_key_;
  std::string agent_name_;

  ExchangeTracker tracker_;
  MemoryCache<std::string, std::vector<crypto::PublicKey>> device_keys_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_ENCRYPTING_PROXY_H
