#define HITL_LOG_COMPONENT "crypto"

#include "hitl/crypto/key_manager.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstring>

#include <nlohmann/json.hpp>

#include "hitl/core/error.h"
#include "hitl/crypto/encoding.h"
#include "hitl/logging/log_macros.h"
#include "hitl/storage/secure_file.h"

namespace hitl {
namespace crypto {

namespace {

void derivePublicKey(const uint8_t* private_key, PublicKey& public_key) {
  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                private_key, kKeySize);
  if (!pkey) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Failed to load X25519 private key");
  }
  size_t len = public_key.size();
  int rc = EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &len);
  EVP_PKEY_free(pkey);
  if (rc != 1 || len != kKeySize) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Failed to derive X25519 public key");
  }
}

// Overwrites a string holding secret material before it is released
void wipe(std::string& secret) {
  if (!secret.empty()) {
    OPENSSL_cleanse(&secret[0], secret.size());
  }
  secret.clear();
}

}  // namespace

std::string publicKeyToBase64(const PublicKey& key) {
  return base64Encode(
      std::string(reinterpret_cast<const char*>(key.data()), key.size()));
}

optional<PublicKey> publicKeyFromBase64(const std::string& encoded) {
  auto raw = base64Decode(encoded);
  if (!raw || raw->size() != kKeySize) {
    return nullopt;
  }
  PublicKey key;
  std::memcpy(key.data(), raw->data(), kKeySize);
  return key;
}

AgentKeyPair::AgentKeyPair(const uint8_t* private_key,
                           std::chrono::system_clock::time_point created)
    : created_(created) {
  std::memcpy(private_key_.data(), private_key, kKeySize);
  derivePublicKey(private_key_.data(), public_key_);
}

AgentKeyPair::~AgentKeyPair() {
  OPENSSL_cleanse(private_key_.data(), private_key_.size());
}

std::shared_ptr<AgentKeyPair> AgentKeyPair::generate(
    std::chrono::system_clock::time_point created) {
  std::array<uint8_t, kKeySize> seed;
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Random number generator failure");
  }
  std::shared_ptr<AgentKeyPair> key_pair;
  try {
    key_pair.reset(new AgentKeyPair(seed.data(), created));
  } catch (...) {
    OPENSSL_cleanse(seed.data(), seed.size());
    throw;
  }
  OPENSSL_cleanse(seed.data(), seed.size());
  return key_pair;
}

std::shared_ptr<AgentKeyPair> AgentKeyPair::fromPrivateKey(
    const std::string& private_key,
    std::chrono::system_clock::time_point created) {
  if (private_key.size() != kKeySize) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Private key must be 32 bytes");
  }
  return std::shared_ptr<AgentKeyPair>(new AgentKeyPair(
      reinterpret_cast<const uint8_t*>(private_key.data()), created));
}

KeyManager::KeyManager(const std::string& key_file) : key_file_(key_file) {}

std::string KeyManager::serialize(const AgentKeyPair& key_pair) const {
  std::string private_raw(
      reinterpret_cast<const char*>(key_pair.private_key_.data()), kKeySize);
  nlohmann::json doc;
  doc["version"] = 1;
  doc["public_key"] = key_pair.publicKeyBase64();
  doc["private_key"] = base64Encode(private_raw);
  doc["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                          key_pair.created_.time_since_epoch())
                          .count();
  wipe(private_raw);

  std::string text = doc.dump(2);
  // The json object keeps its own copy of the encoded private key
  wipe(doc["private_key"].get_ref<std::string&>());
  return text;
}

std::shared_ptr<const AgentKeyPair> KeyManager::loadKeyPair() {
  auto content = storage::readFile(key_file_, true);
  if (!content) {
    return nullptr;
  }

  std::shared_ptr<AgentKeyPair> key_pair;
  try {
    auto doc = nlohmann::json::parse(*content);
    wipe(*content);

    std::string private_b64 = doc.at("private_key").get<std::string>();
    std::string public_b64 = doc.at("public_key").get<std::string>();
    wipe(doc["private_key"].get_ref<std::string&>());

    auto private_raw = base64Decode(private_b64);
    wipe(private_b64);
    if (!private_raw) {
      throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                      "Invalid private key encoding in " + key_file_);
    }

    std::chrono::system_clock::time_point created;
    if (doc.contains("created_at") && doc["created_at"].is_number_integer()) {
      created = std::chrono::system_clock::time_point(
          std::chrono::seconds(doc["created_at"].get<int64_t>()));
    }

    try {
      key_pair = AgentKeyPair::fromPrivateKey(*private_raw, created);
    } catch (...) {
      wipe(*private_raw);
      throw;
    }
    wipe(*private_raw);

    if (key_pair->publicKeyBase64() != public_b64) {
      throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                      "Public key in " + key_file_ +
                          " does not match its private key");
    }
  } catch (const nlohmann::json::exception& e) {
    if (content) {
      wipe(*content);
    }
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Malformed key file " + key_file_ + ": " + e.what());
  }
  return key_pair;
}

std::shared_ptr<const AgentKeyPair> KeyManager::ensureKeyPair(bool* generated) {
  if (generated) {
    *generated = false;
  }

  auto existing = loadKeyPair();
  if (existing) {
    HITL_LOG(Debug, "Loaded agent keypair {}", existing->publicKeyBase64());
    return existing;
  }

  size_t slash = key_file_.rfind('/');
  if (slash != std::string::npos && slash > 0) {
    storage::ensureDirectory(key_file_.substr(0, slash));
  }

  auto key_pair = AgentKeyPair::generate();
  std::string text = serialize(*key_pair);
  bool created;
  try {
    created = storage::writeOnce(key_file_, text);
  } catch (...) {
    wipe(text);
    throw;
  }
  wipe(text);

  if (!created) {
    // Another process won the race; its key is the one on disk
    HITL_LOG(Info, "Agent key created concurrently, loading {}", key_file_);
    auto winner = loadKeyPair();
    if (!winner) {
      throw HitlError(ErrorCode::PERMISSION_ERROR,
                      "Key file vanished after creation: " + key_file_);
    }
    return winner;
  }

  HITL_LOG(Info, "Generated agent keypair {}", key_pair->publicKeyBase64());
  if (generated) {
    *generated = true;
  }
  return key_pair;
}

}  // namespace crypto
}  // namespace hitl
