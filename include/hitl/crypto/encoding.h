#ifndef HITL_CRYPTO_ENCODING_H
#define HITL_CRYPTO_ENCODING_H

#include <string>

#include "hitl/core/compat.h"

namespace hitl {
namespace crypto {

// Standard alphabet with '=' padding
std::string base64Encode(const std::string& data);

// Strict: rejects foreign characters and bad padding
optional<std::string> base64Decode(const std::string& encoded);

// URL-safe alphabet, no padding
std::string base64UrlEncode(const std::string& data);

// Accepts input with or without padding
optional<std::string> base64UrlDecode(const std::string& encoded);

}  // namespace crypto
}  // namespace hitl

#endif  // HITL_CRYPTO_ENCODING_H
