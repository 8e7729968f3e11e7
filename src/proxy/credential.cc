#define HITL_LOG_COMPONENT "proxy"

#include "hitl/proxy/credential.h"

#include <nlohmann/json.hpp>

#include "hitl/core/error.h"
#include "hitl/logging/log_macros.h"
#include "hitl/storage/secure_file.h"

namespace hitl {
namespace proxy {

namespace {

struct AuthorizationVisitor {
  http::Authorization operator()(OAuthCredential& credential) const {
    return http::Authorization::bearer(
        credential.store->getValid().access_token);
  }
  http::Authorization operator()(StaticJwtCredential& credential) const {
    return http::Authorization::bearer(credential.token);
  }
  http::Authorization operator()(ApiKeyCredential& credential) const {
    return http::Authorization::apiKey(credential.key);
  }
};

}  // namespace

CredentialProvider CredentialProvider::resolve(const Context& context,
                                               auth::TokenStore& store) {
  if (!context.config.api_key.empty()) {
    HITL_LOG(Debug, "Using API key credentials");
    return CredentialProvider(ApiKeyCredential{context.config.api_key});
  }

  if (store.load()) {
    HITL_LOG(Debug, "Using OAuth credentials");
    return CredentialProvider(OAuthCredential{&store});
  }

  auto legacy = storage::readFile(context.config.legacyTokenFile(), true);
  if (legacy) {
    auto doc = nlohmann::json::parse(*legacy, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() &&
        doc.contains("access_token") && doc["access_token"].is_string() &&
        !doc["access_token"].get<std::string>().empty()) {
      HITL_LOG(Info, "Using legacy JWT from {}",
               context.config.legacyTokenFile());
      return CredentialProvider(
          StaticJwtCredential{doc["access_token"].get<std::string>()});
    }
    HITL_LOG(Warning, "Ignoring malformed {}",
             context.config.legacyTokenFile());
  }

  throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                  "Not logged in; run 'hitl-cli login'");
}

http::Authorization CredentialProvider::authorization() {
  return visit(AuthorizationVisitor(), source_);
}

const char* CredentialProvider::kindName() const {
  if (holds_alternative<ApiKeyCredential>(source_)) {
    return "api-key";
  }
  return isOAuth() ? "oauth" : "legacy-jwt";
}

}  // namespace proxy
}  // namespace hitl
