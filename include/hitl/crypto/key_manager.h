#ifndef HITL_CRYPTO_KEY_MANAGER_H
#define HITL_CRYPTO_KEY_MANAGER_H

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "hitl/core/compat.h"

/**
 * @file key_manager.h
 * @brief Long-lived X25519 agent keypair
 */

namespace hitl {
namespace crypto {

constexpr size_t kKeySize = 32;

using PublicKey = std::array<uint8_t, kKeySize>;

std::string publicKeyToBase64(const PublicKey& key);

// nullopt unless the input decodes to exactly 32 bytes
optional<PublicKey> publicKeyFromBase64(const std::string& encoded);

/**
 * @brief X25519 keypair of this agent
 *
 * The private half is only visible to EnvelopeCipher and KeyManager and is
 * wiped on destruction.
 */
class AgentKeyPair {
 public:
  ~AgentKeyPair();

  AgentKeyPair(const AgentKeyPair&) = delete;
  AgentKeyPair& operator=(const AgentKeyPair&) = delete;

  const PublicKey& publicKey() const { return public_key_; }
  std::string publicKeyBase64() const { return publicKeyToBase64(public_key_); }
  std::chrono::system_clock::time_point createdAt() const { return created_; }

  /**
   * @brief Fresh keypair from RAND_bytes
   * @throws HitlError(ENCRYPTION_ERROR) when randomness or derivation fails
   */
  static std::shared_ptr<AgentKeyPair> generate(
      std::chrono::system_clock::time_point created =
          std::chrono::system_clock::now());

 private:
  friend class EnvelopeCipher;
  friend class KeyManager;

  AgentKeyPair(const uint8_t* private_key,
               std::chrono::system_clock::time_point created);

  static std::shared_ptr<AgentKeyPair> fromPrivateKey(
      const std::string& private_key,
      std::chrono::system_clock::time_point created);

  std::array<uint8_t, kKeySize> private_key_;
  PublicKey public_key_;
  std::chrono::system_clock::time_point created_;
};

/**
 * @brief Owns agent.key
 *
 * The file is created once (write-once link) and reused across sessions.
 */
class KeyManager {
 public:
  explicit KeyManager(const std::string& key_file);

  /**
   * @brief Load the keypair, generating and persisting it when absent
   * @param generated set to true when this call created the key file
   * @throws HitlError(PERMISSION_ERROR) for group/other-accessible files
   */
  std::shared_ptr<const AgentKeyPair> ensureKeyPair(bool* generated = nullptr);

  // nullptr when no key file exists
  std::shared_ptr<const AgentKeyPair> loadKeyPair();

  const std::string& keyFile() const { return key_file_; }

 private:
  std::string serialize(const AgentKeyPair& key_pair) const;

  std::string key_file_;
};

}  // namespace crypto
}  // namespace hitl

#endif  // HITL_CRYPTO_KEY_MANAGER_H
