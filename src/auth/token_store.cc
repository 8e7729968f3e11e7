#define HITL_LOG_COMPONENT "auth"

#include "hitl/auth/token_store.h"

#include "hitl/core/error.h"
#include "hitl/http/url.h"
#include "hitl/logging/log_macros.h"
#include "hitl/storage/secure_file.h"

namespace hitl {
namespace auth {

TokenStore::TokenStore(const Context& context, ClientRegistrar& registrar)
    : context_(context), registrar_(registrar) {}

optional<TokenSet> TokenStore::load() const {
  std::lock_guard<std::mutex> lock(file_mutex_);
  auto content = storage::readFile(context_.config.tokenFile(), true);
  if (!content) {
    return nullopt;
  }
  try {
    return TokenSet::fromJson(nlohmann::json::parse(*content));
  } catch (const nlohmann::json::exception& e) {
    HITL_LOG(Warning, "Ignoring unreadable token file {}: {}",
             context_.config.tokenFile(), e.what());
    return nullopt;
  }
}

void TokenStore::save(const TokenSet& token) {
  std::lock_guard<std::mutex> lock(file_mutex_);
  storage::ensureDirectory(context_.config.config_dir);
  storage::writeAtomic(context_.config.tokenFile(), token.toJson().dump(2));
  HITL_LOG(Debug, "Saved token {} for agent '{}'",
           maskSecret(token.access_token), token.agent_name);
}

void TokenStore::clear() {
  std::lock_guard<std::mutex> lock(file_mutex_);
  if (storage::removeFile(context_.config.tokenFile())) {
    HITL_LOG(Info, "Cleared stored tokens");
  }
}

bool TokenStore::isExpired(const TokenSet& token) const {
  return isExpired(token, context_.config.refresh_skew);
}

bool TokenStore::isExpired(const TokenSet& token,
                           std::chrono::seconds skew) const {
  return token.isExpired(context_.now(), skew);
}

TokenSet TokenStore::refresh(const TokenSet& token) {
  if (!token.refresh_token) {
    clear();
    throw HitlError(ErrorCode::TOKEN_REFRESH_ERROR,
                    "No refresh token available");
  }

  auto registration = registrar_.cached();
  if (!registration) {
    clear();
    throw HitlError(ErrorCode::TOKEN_REFRESH_ERROR,
                    "No client registration available for refresh");
  }

  http::Params form{{"grant_type", "refresh_token"},
                    {"refresh_token", *token.refresh_token},
                    {"client_id", registration->client_id}};
  if (registration->client_secret) {
    form.emplace_back("client_secret", *registration->client_secret);
  }

  http::HttpRequest request;
  request.url = context_.config.endpoint("/api/v1/oauth/token");
  request.method = http::HttpMethod::POST;
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";
  request.headers["X-MCP-Agent-Name"] = token.agent_name;
  request.body = http::formEncode(form);
  request.timeout = context_.config.request_timeout;

  HITL_LOG(Info, "Refreshing access token for agent '{}'", token.agent_name);

  // NETWORK_ERROR and CANCELLED propagate with the store untouched
  http::HttpResponse response = context_.http->request(request);

  if (response.isClientError()) {
    auto oauth_error = parseOAuthError(response.body);
    HITL_LOG(Warning, "Refresh rejected: HTTP {} {}", response.status_code,
             oauth_error.error);
    clear();
    if (oauth_error.error == "invalid_client" ||
        oauth_error.error == "unauthorized_client") {
      registrar_.invalidate();
    }
    throw HitlError(ErrorCode::TOKEN_REFRESH_ERROR,
                    "Refresh token rejected: HTTP " +
                        std::to_string(response.status_code),
                    oauth_error.error);
  }
  if (!response.isSuccess()) {
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Token endpoint unavailable: HTTP " +
                        std::to_string(response.status_code));
  }

  TokenSet refreshed;
  try {
    refreshed = TokenSet::fromTokenResponse(
        nlohmann::json::parse(response.body), context_.now(),
        context_.config.default_token_lifetime, token.agent_name);
  } catch (const nlohmann::json::exception& e) {
    clear();
    throw HitlError(ErrorCode::TOKEN_REFRESH_ERROR,
                    std::string("Malformed refresh response: ") + e.what());
  } catch (const std::logic_error& e) {
    clear();
    throw HitlError(ErrorCode::TOKEN_REFRESH_ERROR,
                    std::string("Malformed refresh response: ") + e.what());
  }

  if (!refreshed.refresh_token) {
    refreshed.refresh_token = token.refresh_token;
  }
  if (refreshed.scope.empty()) {
    refreshed.scope = token.scope;
  }

  save(refreshed);
  HITL_LOG(Info, "Access token refreshed{}",
           refreshed.refresh_token != token.refresh_token
               ? " (refresh token rotated)"
               : "");
  return refreshed;
}

TokenSet TokenStore::loadValidOrRefresh() {
  auto token = load();
  if (!token) {
    clear();
    throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                    "Not logged in; run 'hitl-cli login'");
  }
  if (!isExpired(*token)) {
    return *token;
  }
  if (!token->refresh_token) {
    clear();
    throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                    "Access token expired and no refresh token is available; "
                    "run 'hitl-cli login'");
  }

  try {
    return refresh(*token);
  } catch (const HitlError& e) {
    if (e.code() == ErrorCode::TOKEN_REFRESH_ERROR) {
      throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                      std::string(e.what()) + "; run 'hitl-cli login'",
                      e.oauthError());
    }
    throw;
  }
}

TokenSet TokenStore::getValid() {
  return refresh_flight_.run([this]() { return loadValidOrRefresh(); });
}

}  // namespace auth
}  // namespace hitl
