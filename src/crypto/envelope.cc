#include "hitl/crypto/envelope.h"

#include <sodium.h>

#include <cstring>
#include <mutex>

#include "hitl/core/error.h"
#include "hitl/crypto/encoding.h"

namespace hitl {
namespace crypto {

static_assert(kNonceSize == crypto_box_NONCEBYTES, "crypto_box nonce size");
static_assert(kMacSize == crypto_box_MACBYTES, "crypto_box mac size");
static_assert(kKeySize == crypto_box_PUBLICKEYBYTES &&
                  kKeySize == crypto_box_SECRETKEYBYTES,
              "crypto_box key size");

namespace {

void ensureSodium() {
  static std::once_flag once;
  static bool ready = false;
  std::call_once(once, []() { ready = sodium_init() >= 0; });
  if (!ready) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Failed to initialize libsodium");
  }
}

bool openBox(const EncryptedEnvelope& envelope,
             const uint8_t* private_key,
             const PublicKey& sender,
             std::string& plaintext) {
  plaintext.assign(envelope.box.size() - kMacSize, '\0');
  auto* out = reinterpret_cast<unsigned char*>(&plaintext[0]);
  if (crypto_box_open_easy(
          out, reinterpret_cast<const unsigned char*>(envelope.box.data()),
          envelope.box.size(), envelope.nonce.data(), sender.data(),
          private_key) != 0) {
    sodium_memzero(out, plaintext.size());
    plaintext.clear();
    return false;
  }
  return true;
}

}  // namespace

std::string EncryptedEnvelope::serialize() const {
  std::string raw(reinterpret_cast<const char*>(nonce.data()), nonce.size());
  raw += box;
  return base64Encode(raw);
}

optional<EncryptedEnvelope> EncryptedEnvelope::parse(
    const std::string& encoded) {
  auto raw = base64Decode(encoded);
  if (!raw || raw->size() < kNonceSize + kMacSize) {
    return nullopt;
  }
  EncryptedEnvelope envelope;
  std::memcpy(envelope.nonce.data(), raw->data(), kNonceSize);
  envelope.box = raw->substr(kNonceSize);
  return envelope;
}

std::string EnvelopeCipher::seal(const std::string& plaintext,
                                 const AgentKeyPair& own,
                                 const PublicKey& recipient) {
  ensureSodium();

  EncryptedEnvelope envelope;
  randombytes_buf(envelope.nonce.data(), envelope.nonce.size());

  envelope.box.assign(plaintext.size() + kMacSize, '\0');
  if (crypto_box_easy(
          reinterpret_cast<unsigned char*>(&envelope.box[0]),
          reinterpret_cast<const unsigned char*>(plaintext.data()),
          plaintext.size(), envelope.nonce.data(), recipient.data(),
          own.private_key_.data()) != 0) {
    throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                    "Key agreement with recipient failed");
  }
  return envelope.serialize();
}

std::string EnvelopeCipher::open(const std::string& encoded,
                                 const AgentKeyPair& own,
                                 const PublicKey& sender) {
  return openFromAny(encoded, own, {sender}).plaintext;
}

OpenedEnvelope EnvelopeCipher::openFromAny(
    const std::string& encoded,
    const AgentKeyPair& own,
    const std::vector<PublicKey>& senders) {
  ensureSodium();

  auto envelope = EncryptedEnvelope::parse(encoded);
  if (!envelope) {
    throw HitlError(ErrorCode::DECRYPTION_ERROR,
                    "Malformed encrypted envelope");
  }

  OpenedEnvelope opened;
  for (const auto& sender : senders) {
    if (openBox(*envelope, own.private_key_.data(), sender,
                opened.plaintext)) {
      opened.sender_public_key = sender;
      return opened;
    }
  }
  throw HitlError(ErrorCode::DECRYPTION_ERROR,
                  "Envelope authentication failed");
}

}  // namespace crypto
}  // namespace hitl
