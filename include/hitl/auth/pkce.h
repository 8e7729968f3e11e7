#ifndef HITL_AUTH_PKCE_H
#define HITL_AUTH_PKCE_H

#include <chrono>
#include <string>

#include "hitl/auth/auth_types.h"

/**
 * @file pkce.h
 * @brief RFC 7636 verifier/challenge pairs and CSRF state tokens
 *
 * Every call draws fresh randomness from RAND_bytes; a failing generator
 * raises HitlError(ENCRYPTION_ERROR).
 */

namespace hitl {
namespace auth {

constexpr size_t kDefaultVerifierBytes = 32;
constexpr std::chrono::seconds kDefaultPkceTtl{300};
constexpr std::chrono::seconds kMinimumPkceTtl{60};

/**
 * @brief Random URL-safe verifier
 * @param random_bytes in [32, 96], giving 43 to 128 characters
 */
std::string generateCodeVerifier(size_t random_bytes = kDefaultVerifierBytes);

// base64url(SHA-256(verifier)) without padding
std::string computeCodeChallenge(const std::string& verifier);

// Constant-time comparison of challenge against computeCodeChallenge(verifier)
bool verifyCodeChallenge(const std::string& verifier,
                         const std::string& challenge);

// 43 characters, independent of any verifier
std::string generateState();

/**
 * @brief Bundle a verifier, its challenge and a state for one login attempt
 * @param ttl clamped to at least 60 seconds
 */
PkceSession createPkceSession(const std::string& redirect_uri,
                              TimePoint now,
                              std::chrono::seconds ttl = kDefaultPkceTtl);

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_PKCE_H
