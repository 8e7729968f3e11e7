#ifndef HITL_AUTH_CLIENT_REGISTRAR_H
#define HITL_AUTH_CLIENT_REGISTRAR_H

#include <mutex>
#include <string>

#include "hitl/auth/auth_types.h"
#include "hitl/context.h"

/**
 * @file client_registrar.h
 * @brief RFC 7591 dynamic client registration with an on-disk cache
 */

namespace hitl {
namespace auth {

class ClientRegistrar {
 public:
  explicit ClientRegistrar(const Context& context);

  /**
   * @brief Reuse the cached registration or register a new client
   * @param reused set to true when the cached record was returned
   * @throws HitlError(REGISTRATION_ERROR) on any failure; nothing is cached
   */
  ClientRegistration registerClient(const std::string& agent_name,
                                    const std::string& redirect_uri,
                                    bool* reused = nullptr);

  // The persisted registration, if any (unreadable records count as absent)
  optional<ClientRegistration> cached() const;

  // Drops the persisted registration
  void invalidate();

  /**
   * @brief Redirect URI comparison
   *
   * Loopback http URIs match regardless of port (RFC 8252 section 7.3); all
   * other URIs must be identical.
   */
  static bool redirectUrisMatch(const std::string& registered,
                                const std::string& requested);

 private:
  bool isReusable(const ClientRegistration& reg,
                  const std::string& agent_name,
                  const std::string& redirect_uri) const;
  ClientRegistration performRegistration(const std::string& agent_name,
                                         const std::string& redirect_uri);

  const Context& context_;
  mutable std::mutex mutex_;
};

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_CLIENT_REGISTRAR_H
