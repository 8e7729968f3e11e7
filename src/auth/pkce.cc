#include "hitl/auth/pkce.h"

#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <vector>

#include "hitl/core/error.h"
#include "hitl/crypto/encoding.h"

namespace hitl {
namespace auth {

namespace {

std::string randomUrlSafe(size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Random number generator failure");
  }
  std::string raw(buffer.begin(), buffer.end());
  OPENSSL_cleanse(buffer.data(), buffer.size());
  return crypto::base64UrlEncode(raw);
}

}  // namespace

std::string generateCodeVerifier(size_t random_bytes) {
  if (random_bytes < 32 || random_bytes > 96) {
    throw HitlError(ErrorCode::CONFIGURATION_ERROR,
                    "PKCE verifier entropy must be 32 to 96 bytes");
  }
  return randomUrlSafe(random_bytes);
}

std::string computeCodeChallenge(const std::string& verifier) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(verifier.data()),
         verifier.size(), digest);
  return crypto::base64UrlEncode(
      std::string(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

bool verifyCodeChallenge(const std::string& verifier,
                         const std::string& challenge) {
  std::string expected = computeCodeChallenge(verifier);
  if (expected.size() != challenge.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), challenge.data(), expected.size()) == 0;
}

std::string generateState() { return randomUrlSafe(32); }

PkceSession createPkceSession(const std::string& redirect_uri,
                              TimePoint now,
                              std::chrono::seconds ttl) {
  PkceSession session;
  session.code_verifier = generateCodeVerifier();
  session.code_challenge = computeCodeChallenge(session.code_verifier);
  session.state = generateState();
  session.redirect_uri = redirect_uri;
  session.created_at = now;
  session.expires_at = now + std::max(ttl, kMinimumPkceTtl);
  return session;
}

}  // namespace auth
}  // namespace hitl
