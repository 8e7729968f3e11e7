#ifndef HITL_PROXY_CREDENTIAL_H
#define HITL_PROXY_CREDENTIAL_H

#include <string>

#include "hitl/auth/token_store.h"
#include "hitl/context.h"
#include "hitl/core/compat.h"
#include "hitl/http/http_client.h"

namespace hitl {
namespace proxy {

// Bearer token from the OAuth token store, refreshed on demand
struct OAuthCredential {
  auth::TokenStore* store;
};

// Static JWT from the legacy token.json
struct StaticJwtCredential {
  std::string token;
};

// Long-lived API key, sent as X-API-Key instead of a bearer token
struct ApiKeyCredential {
  std::string key;
};

using CredentialSource =
    variant<OAuthCredential, StaticJwtCredential, ApiKeyCredential>;

/**
 * @brief Credential kind chosen once at session start
 */
class CredentialProvider {
 public:
  explicit CredentialProvider(CredentialSource source)
      : source_(std::move(source)) {}

  /**
   * @brief API key when configured, else OAuth when oauth_token.json exists,
   *        else legacy token.json
   * @throws HitlError(REAUTHENTICATION_REQUIRED) when none is available
   */
  static CredentialProvider resolve(const Context& context,
                                    auth::TokenStore& store);

  // May refresh; throws HitlError(REAUTHENTICATION_REQUIRED)
  http::Authorization authorization();

  bool isOAuth() const { return holds_alternative<OAuthCredential>(source_); }

  const char* kindName() const;

 private:
  CredentialSource source_;
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_CREDENTIAL_H
