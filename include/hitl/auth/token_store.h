#ifndef HITL_AUTH_TOKEN_STORE_H
#define HITL_AUTH_TOKEN_STORE_H

#include <chrono>
#include <mutex>

#include "hitl/auth/auth_types.h"
#include "hitl/auth/client_registrar.h"
#include "hitl/auth/single_flight.h"
#include "hitl/context.h"

/**
 * @file token_store.h
 * @brief Persistence, validation and refresh of OAuth token sets
 */

namespace hitl {
namespace auth {

class TokenStore {
 public:
  TokenStore(const Context& context, ClientRegistrar& registrar);

  // nullopt when nothing (readable) is stored
  optional<TokenSet> load() const;

  void save(const TokenSet& token);

  void clear();

  // now >= expiry - skew; skew defaults to the configured refresh skew
  bool isExpired(const TokenSet& token) const;
  bool isExpired(const TokenSet& token, std::chrono::seconds skew) const;

  /**
   * @brief Exchange the refresh token for a new token set and persist it
   *
   * A rotated refresh token replaces the old one; when the server omits it
   * the old one is kept.
   * @throws HitlError(TOKEN_REFRESH_ERROR) when the server rejects the
   *         refresh; the store is cleared
   * @throws HitlError(NETWORK_ERROR) when the server cannot be reached; the
   *         store is untouched
   */
  TokenSet refresh(const TokenSet& token);

  /**
   * @brief A token that is valid for at least the refresh skew
   *
   * Concurrent callers share one refresh.
   * @throws HitlError(REAUTHENTICATION_REQUIRED) when a new login is needed
   */
  TokenSet getValid();

 private:
  TokenSet loadValidOrRefresh();

  const Context& context_;
  ClientRegistrar& registrar_;
  mutable std::mutex file_mutex_;
  SingleFlight<TokenSet> refresh_flight_;
};

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_TOKEN_STORE_H
