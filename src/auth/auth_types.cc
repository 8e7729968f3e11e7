#include "hitl/auth/auth_types.h"

#include <cstdlib>

namespace hitl {
namespace auth {

namespace {

int64_t toEpochSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

TimePoint fromEpochSeconds(int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

}  // namespace

nlohmann::json ClientRegistration::toJson() const {
  nlohmann::json j;
  j["client_id"] = client_id;
  if (client_secret) {
    j["client_secret"] = *client_secret;
  }
  j["redirect_uri"] = redirect_uri;
  j["registered_at"] = toEpochSeconds(registered_at);
  j["issuer"] = issuer;
  j["agent_name"] = agent_name;
  return j;
}

ClientRegistration ClientRegistration::fromJson(const nlohmann::json& j) {
  ClientRegistration reg;
  reg.client_id = j.at("client_id").get<std::string>();
  if (j.contains("client_secret") && j["client_secret"].is_string()) {
    reg.client_secret = j["client_secret"].get<std::string>();
  }
  reg.redirect_uri = j.value("redirect_uri", "");
  reg.registered_at = fromEpochSeconds(j.value("registered_at", int64_t(0)));
  reg.issuer = j.value("issuer", "");
  reg.agent_name = j.value("agent_name", "");
  return reg;
}

nlohmann::json TokenSet::toJson() const {
  nlohmann::json j;
  j["access_token"] = access_token;
  if (refresh_token) {
    j["refresh_token"] = *refresh_token;
  }
  j["token_type"] = token_type;
  j["expires_at"] = toEpochSeconds(expires_at);
  j["scope"] = scope;
  j["agent_name"] = agent_name;
  return j;
}

TokenSet TokenSet::fromJson(const nlohmann::json& j) {
  TokenSet token;
  token.access_token = j.at("access_token").get<std::string>();
  if (j.contains("refresh_token") && j["refresh_token"].is_string()) {
    token.refresh_token = j["refresh_token"].get<std::string>();
  }
  token.token_type = j.value("token_type", "Bearer");
  // A token without a known expiry is treated as already expired
  token.expires_at = fromEpochSeconds(j.value("expires_at", int64_t(0)));
  token.scope = j.value("scope", "");
  token.agent_name = j.value("agent_name", "");
  return token;
}

TokenSet TokenSet::fromTokenResponse(const nlohmann::json& response,
                                     TimePoint now,
                                     std::chrono::seconds default_lifetime,
                                     const std::string& agent_name) {
  TokenSet token;
  token.access_token = response.at("access_token").get<std::string>();
  if (response.contains("refresh_token") &&
      response["refresh_token"].is_string()) {
    token.refresh_token = response["refresh_token"].get<std::string>();
  }
  token.token_type = response.value("token_type", "Bearer");
  token.scope = response.value("scope", "");

  std::chrono::seconds lifetime = default_lifetime;
  if (response.contains("expires_in")) {
    const auto& expires_in = response["expires_in"];
    if (expires_in.is_number()) {
      lifetime = std::chrono::seconds(expires_in.get<int64_t>());
    } else if (expires_in.is_string()) {
      std::string text = expires_in.get<std::string>();
      char* end = nullptr;
      long long value = std::strtoll(text.c_str(), &end, 10);
      if (end != text.c_str() && *end == '\0') {
        lifetime = std::chrono::seconds(value);
      }
    }
  }
  token.expires_at = now + lifetime;
  token.agent_name = agent_name;
  return token;
}

OAuthErrorBody parseOAuthError(const std::string& body) {
  OAuthErrorBody result;
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return result;
  }
  if (j.contains("error") && j["error"].is_string()) {
    result.error = j["error"].get<std::string>();
  }
  if (j.contains("error_description") && j["error_description"].is_string()) {
    result.description = j["error_description"].get<std::string>();
  } else if (j.contains("detail") && j["detail"].is_string()) {
    result.description = j["detail"].get<std::string>();
  }
  return result;
}

std::string joinScopes(const std::vector<std::string>& scopes) {
  std::string joined;
  for (const auto& scope : scopes) {
    if (scope.empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += scope;
  }
  return joined;
}

std::string maskSecret(const std::string& value) {
  if (value.size() <= 8) {
    return std::string(value.size(), '*');
  }
  return value.substr(0, 4) + "..." + std::to_string(value.size()) + " chars";
}

}  // namespace auth
}  // namespace hitl
