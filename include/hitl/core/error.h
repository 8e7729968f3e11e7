#ifndef HITL_CORE_ERROR_H
#define HITL_CORE_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file error.h
 * @brief Error taxonomy shared by the authorization flow and the proxy
 */

namespace hitl {

/**
 * @brief Error codes for every failure the core can surface
 */
enum class ErrorCode : int32_t {
  REGISTRATION_ERROR = -2000,
  AUTHORIZATION_DENIED = -2001,
  AUTHORIZATION_TIMEOUT = -2002,
  STATE_MISMATCH = -2003,
  TOKEN_EXCHANGE_ERROR = -2004,
  TOKEN_REFRESH_ERROR = -2005,
  REAUTHENTICATION_REQUIRED = -2006,
  ENCRYPTION_ERROR = -2007,
  DECRYPTION_ERROR = -2008,
  NETWORK_ERROR = -2009,
  PERMISSION_ERROR = -2010,
  CANCELLED = -2011,
  CONFIGURATION_ERROR = -2012
};

const char* errorCodeToString(ErrorCode code);

/**
 * @brief Exception carrying an ErrorCode
 *
 * oauthError() holds the RFC 6749 "error" value when the failure came from
 * an OAuth endpoint (e.g. "invalid_client", "invalid_grant").
 */
class HitlError : public std::runtime_error {
 public:
  HitlError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  HitlError(ErrorCode code,
            const std::string& message,
            const std::string& oauth_error)
      : std::runtime_error(message), code_(code), oauth_error_(oauth_error) {}

  ErrorCode code() const { return code_; }
  const std::string& oauthError() const { return oauth_error_; }

  // True when the server rejected the client credentials themselves
  bool isInvalidClient() const {
    return oauth_error_ == "invalid_client" ||
           oauth_error_ == "unauthorized_client";
  }

 private:
  ErrorCode code_;
  std::string oauth_error_;
};

}  // namespace hitl

#endif  // HITL_CORE_ERROR_H
