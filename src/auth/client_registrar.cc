#define HITL_LOG_COMPONENT "auth"

#include "hitl/auth/client_registrar.h"

#include "hitl/core/error.h"
#include "hitl/http/url.h"
#include "hitl/logging/log_macros.h"
#include "hitl/storage/secure_file.h"

namespace hitl {
namespace auth {

ClientRegistrar::ClientRegistrar(const Context& context) : context_(context) {}

bool ClientRegistrar::redirectUrisMatch(const std::string& registered,
                                        const std::string& requested) {
  if (registered == requested) {
    return true;
  }
  http::UrlParts a;
  http::UrlParts b;
  if (!http::parseUrl(registered, a) || !http::parseUrl(requested, b)) {
    return false;
  }
  if (!http::isLoopbackUrl(a) || !http::isLoopbackUrl(b)) {
    return false;
  }
  return a.host == b.host && a.path == b.path && a.query == b.query;
}

optional<ClientRegistration> ClientRegistrar::cached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto content = storage::readFile(context_.config.clientFile(), true);
  if (!content) {
    return nullopt;
  }
  try {
    return ClientRegistration::fromJson(nlohmann::json::parse(*content));
  } catch (const nlohmann::json::exception& e) {
    HITL_LOG(Warning, "Ignoring unreadable client registration {}: {}",
             context_.config.clientFile(), e.what());
    return nullopt;
  }
}

void ClientRegistrar::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (storage::removeFile(context_.config.clientFile())) {
    HITL_LOG(Info, "Discarded cached client registration");
  }
}

bool ClientRegistrar::isReusable(const ClientRegistration& reg,
                                 const std::string& agent_name,
                                 const std::string& redirect_uri) const {
  if (reg.client_id.empty()) {
    return false;
  }
  if (reg.issuer != context_.config.backend_url) {
    HITL_LOG(Debug, "Cached client was issued by {}, not {}", reg.issuer,
             context_.config.backend_url);
    return false;
  }
  if (!reg.agent_name.empty() && reg.agent_name != agent_name) {
    return false;
  }
  return redirectUrisMatch(reg.redirect_uri, redirect_uri);
}

ClientRegistration ClientRegistrar::registerClient(
    const std::string& agent_name,
    const std::string& redirect_uri,
    bool* reused) {
  if (reused) {
    *reused = false;
  }

  auto existing = cached();
  if (existing && isReusable(*existing, agent_name, redirect_uri)) {
    HITL_LOG(Info, "Reusing registered client {}", existing->client_id);
    if (reused) {
      *reused = true;
    }
    // The redirect actually in use this time
    existing->redirect_uri = redirect_uri;
    return *existing;
  }

  return performRegistration(agent_name, redirect_uri);
}

ClientRegistration ClientRegistrar::performRegistration(
    const std::string& agent_name,
    const std::string& redirect_uri) {
  nlohmann::json body;
  body["client_name"] = "HITL CLI - " + agent_name;
  body["redirect_uris"] = nlohmann::json::array({redirect_uri});
  body["grant_types"] = nlohmann::json::array(
      {"authorization_code", "refresh_token"});
  body["response_types"] = nlohmann::json::array({"code"});
  body["token_endpoint_auth_method"] = "client_secret_post";
  body["scope"] = joinScopes(context_.config.scopes);

  http::HttpRequest request;
  request.url = context_.config.endpoint("/api/v1/oauth/register");
  request.method = http::HttpMethod::POST;
  request.headers["Content-Type"] = "application/json";
  request.headers["Accept"] = "application/json";
  request.body = body.dump();
  request.timeout = context_.config.request_timeout;

  HITL_LOG(Info, "Registering OAuth client for agent '{}' at {}", agent_name,
           request.url);

  http::HttpResponse response;
  try {
    response = context_.http->request(request);
  } catch (const HitlError& e) {
    if (e.code() == ErrorCode::CANCELLED) {
      throw;
    }
    throw HitlError(ErrorCode::REGISTRATION_ERROR,
                    std::string("Client registration failed: ") + e.what());
  }

  if (!response.isSuccess()) {
    auto oauth_error = parseOAuthError(response.body);
    throw HitlError(ErrorCode::REGISTRATION_ERROR,
                    "Client registration failed: HTTP " +
                        std::to_string(response.status_code) +
                        (oauth_error.error.empty()
                             ? std::string()
                             : " (" + oauth_error.error + ")"),
                    oauth_error.error);
  }

  ClientRegistration reg;
  try {
    auto j = nlohmann::json::parse(response.body);
    if (!j.is_object() || !j.contains("client_id") ||
        !j["client_id"].is_string() ||
        j["client_id"].get<std::string>().empty()) {
      throw HitlError(ErrorCode::REGISTRATION_ERROR,
                      "Registration response has no client_id");
    }
    reg.client_id = j["client_id"].get<std::string>();
    if (j.contains("client_secret") && j["client_secret"].is_string()) {
      reg.client_secret = j["client_secret"].get<std::string>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw HitlError(ErrorCode::REGISTRATION_ERROR,
                    std::string("Malformed registration response: ") +
                        e.what());
  }
  reg.redirect_uri = redirect_uri;
  reg.registered_at = context_.now();
  reg.issuer = context_.config.backend_url;
  reg.agent_name = agent_name;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
      storage::ensureDirectory(context_.config.config_dir);
      storage::writeAtomic(context_.config.clientFile(), reg.toJson().dump(2));
    } catch (const HitlError& e) {
      throw HitlError(ErrorCode::REGISTRATION_ERROR,
                      std::string("Cannot persist client registration: ") +
                          e.what());
    }
  }

  HITL_LOG(Info, "Registered {} client {}",
           reg.client_secret ? "confidential" : "public", reg.client_id);
  return reg;
}

}  // namespace auth
}  // namespace hitl
