#ifndef HITL_API_BACKEND_CLIENT_H
#define HITL_API_BACKEND_CLIENT_H

#include <string>
#include <vector>

#include "hitl/context.h"
#include "hitl/core/compat.h"
#include "hitl/crypto/key_manager.h"

/**
 * @file backend_client.h
 * @brief REST calls to the backend outside the OAuth endpoints
 */

namespace hitl {
namespace api {

class BackendClient {
 public:
  explicit BackendClient(const Context& context);

  /**
   * @brief Public keys of the user's devices
   *
   * Entries that are not 32-byte base64 keys are skipped.
   * @throws HitlError(REAUTHENTICATION_REQUIRED) on 401
   * @throws HitlError(NETWORK_ERROR) when the backend is unreachable or 5xx
   * @throws HitlError(ENCRYPTION_ERROR) for any other rejection
   */
  std::vector<crypto::PublicKey> getDevicePublicKeys(
      const http::Authorization& authorization,
      const std::string& agent_name);

  // POST /api/v1/keys/register for entity_type "agent"
  void registerAgentKey(const http::Authorization& authorization,
                        const std::string& agent_id,
                        const std::string& public_key_base64);

  // "agent_id" claim of an unverified JWT payload
  static optional<std::string> agentIdFromToken(const std::string& token);

 private:
  const Context& context_;
};

}  // namespace api
}  // namespace hitl

#endif  // HITL_API_BACKEND_CLIENT_H
