#ifndef HITL_CRYPTO_ENVELOPE_H
#define HITL_CRYPTO_ENVELOPE_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "hitl/core/compat.h"
#include "hitl/crypto/key_manager.h"

/**
 * @file envelope.h
 * @brief Authenticated public-key envelopes between agent and devices
 *
 * Wire form, base64 encoded:
 *   nonce(24) || mac(16) || ciphertext
 *
 * This is NaCl crypto_box (X25519 + XSalsa20-Poly1305) as produced by the
 * mobile clients. The sender key is not part of the envelope; a receiver
 * authenticates it by trying the public keys it trusts.
 */

namespace hitl {
namespace crypto {

constexpr size_t kNonceSize = 24;
constexpr size_t kMacSize = 16;

struct EncryptedEnvelope {
  std::array<uint8_t, kNonceSize> nonce{};
  std::string box;  // mac followed by ciphertext

  std::string serialize() const;

  // nullopt on bad base64 or input shorter than nonce and mac
  static optional<EncryptedEnvelope> parse(const std::string& encoded);
};

struct OpenedEnvelope {
  std::string plaintext;
  PublicKey sender_public_key{};
};

class EnvelopeCipher {
 public:
  /**
   * @brief Encrypt plaintext from own key to recipient with a random nonce
   * @return serialized envelope
   * @throws HitlError(ENCRYPTION_ERROR)
   */
  static std::string seal(const std::string& plaintext,
                          const AgentKeyPair& own,
                          const PublicKey& recipient);

  /**
   * @brief Authenticate and decrypt an envelope from a known sender
   * @throws HitlError(DECRYPTION_ERROR) on any format or MAC failure
   */
  static std::string open(const std::string& encoded,
                          const AgentKeyPair& own,
                          const PublicKey& sender);

  /**
   * @brief Open with the first sender key that authenticates the envelope
   * @throws HitlError(DECRYPTION_ERROR) when none does
   */
  static OpenedEnvelope openFromAny(const std::string& encoded,
                                    const AgentKeyPair& own,
                                    const std::vector<PublicKey>& senders);
};

}  // namespace crypto
}  // namespace hitl

#endif  // HITL_CRYPTO_ENVELOPE_H
