#ifndef HITL_AUTH_AUTH_TYPES_H
#define HITL_AUTH_AUTH_TYPES_H

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hitl/core/clock.h"
#include "hitl/core/compat.h"

/**
 * @file auth_types.h
 * @brief Records produced and persisted by the authorization flow
 */

namespace hitl {
namespace auth {

/**
 * @brief Result of RFC 7591 dynamic client registration
 */
struct ClientRegistration {
  std::string client_id;
  optional<std::string> client_secret;  // absent for public clients
  std::string redirect_uri;
  TimePoint registered_at;
  std::string issuer;      // backend base URL that issued the client
  std::string agent_name;

  nlohmann::json toJson() const;

  // Throws nlohmann::json::exception on missing fields
  static ClientRegistration fromJson(const nlohmann::json& j);
};

/**
 * @brief Per-attempt PKCE material; lives in memory only
 */
struct PkceSession {
  std::string code_verifier;
  std::string code_challenge;
  std::string state;
  std::string redirect_uri;
  TimePoint created_at;
  TimePoint expires_at;

  bool isExpired(TimePoint now) const { return now >= expires_at; }
};

struct TokenSet {
  std::string access_token;
  optional<std::string> refresh_token;
  std::string token_type = "Bearer";
  TimePoint expires_at;
  std::string scope;
  std::string agent_name;

  // now >= expires_at - skew
  bool isExpired(TimePoint now, std::chrono::seconds skew) const {
    return now >= expires_at - skew;
  }

  nlohmann::json toJson() const;
  static TokenSet fromJson(const nlohmann::json& j);

  /**
   * @brief Build from a token endpoint response body
   * @param default_lifetime used when the response omits expires_in
   */
  static TokenSet fromTokenResponse(const nlohmann::json& response,
                                    TimePoint now,
                                    std::chrono::seconds default_lifetime,
                                    const std::string& agent_name);
};

/**
 * @brief RFC 6749 section 5.2 error body
 *
 * Both fields are empty when the body is not a JSON error object.
 */
struct OAuthErrorBody {
  std::string error;
  std::string description;
};

OAuthErrorBody parseOAuthError(const std::string& body);

// Space separated scope parameter (RFC 6749 section 3.3)
std::string joinScopes(const std::vector<std::string>& scopes);

// Masks all but a short prefix so identifiers can appear in logs
std::string maskSecret(const std::string& value);

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_AUTH_TYPES_H
