#include <gtest/gtest.h>

#include <sys/stat.h>

#include <fstream>
#include <nlohmann/json.hpp>

#include "hitl/core/error.h"
#include "hitl/crypto/envelope.h"
#include "hitl/crypto/key_manager.h"
#include "hitl/storage/secure_file.h"
#include "../mocks/temp_dir.h"

namespace hitl {
namespace crypto {
namespace {

class KeyManagerTest : public ::testing::Test {
 protected:
  std::string keyFile() const { return dir_.file("cfg/agent.key"); }

  test::TempDir dir_;
};

TEST_F(KeyManagerTest, GeneratesOnceAndReuses) {
  KeyManager manager(keyFile());
  EXPECT_EQ(manager.loadKeyPair(), nullptr);

  bool generated = false;
  auto first = manager.ensureKeyPair(&generated);
  ASSERT_NE(first, nullptr);
  EXPECT_TRUE(generated);
  EXPECT_EQ(storage::fileMode(keyFile()), 0600);
  EXPECT_EQ(storage::fileMode(dir_.file("cfg")), 0700);

  auto second = KeyManager(keyFile()).ensureKeyPair(&generated);
  EXPECT_FALSE(generated);
  EXPECT_EQ(second->publicKey(), first->publicKey());
}

TEST_F(KeyManagerTest, ReloadedKeyStillDecrypts) {
  auto original = KeyManager(keyFile()).ensureKeyPair();
  auto device = AgentKeyPair::generate();
  std::string sealed =
      EnvelopeCipher::seal("reply", *device, original->publicKey());

  auto reloaded = KeyManager(keyFile()).loadKeyPair();
  ASSERT_NE(reloaded, nullptr);
  EXPECT_EQ(EnvelopeCipher::open(sealed, *reloaded, device->publicKey()),
            "reply");
}

TEST_F(KeyManagerTest, FileHoldsBase64Keys) {
  auto key_pair = KeyManager(keyFile()).ensureKeyPair();
  auto content = storage::readFile(keyFile());
  ASSERT_TRUE(content.has_value());
  auto doc = nlohmann::json::parse(*content);
  EXPECT_EQ(doc["version"], 1);
  EXPECT_EQ(doc["public_key"], key_pair->publicKeyBase64());
  EXPECT_EQ(doc["private_key"].get<std::string>().size(), 44u);
  EXPECT_NE(doc["private_key"], doc["public_key"]);
}

TEST_F(KeyManagerTest, LoosePermissionsAreRejected) {
  KeyManager manager(keyFile());
  manager.ensureKeyPair();
  ::chmod(keyFile().c_str(), 0644);

  try {
    manager.loadKeyPair();
    FAIL() << "expected permission error";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::PERMISSION_ERROR);
  }
  EXPECT_THROW(manager.ensureKeyPair(), HitlError);
}

TEST_F(KeyManagerTest, MismatchedPublicKeyIsRejected) {
  KeyManager manager(keyFile());
  manager.ensureKeyPair();

  auto doc = nlohmann::json::parse(*storage::readFile(keyFile()));
  doc["public_key"] = AgentKeyPair::generate()->publicKeyBase64();
  storage::writeAtomic(keyFile(), doc.dump());

  try {
    manager.loadKeyPair();
    FAIL() << "expected key mismatch";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::ENCRYPTION_ERROR);
  }
}

TEST_F(KeyManagerTest, CorruptFileIsNotOverwritten) {
  storage::ensureDirectory(dir_.file("cfg"));
  storage::writeAtomic(keyFile(), "{ not json");

  KeyManager manager(keyFile());
  EXPECT_THROW(manager.ensureKeyPair(), HitlError);
  EXPECT_EQ(*storage::readFile(keyFile()), "{ not json");
}

TEST(PublicKeyEncodingTest, RequiresExactly32Bytes) {
  auto key = AgentKeyPair::generate();
  auto decoded = publicKeyFromBase64(key->publicKeyBase64());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, key->publicKey());

  EXPECT_FALSE(publicKeyFromBase64("AAAA").has_value());
  EXPECT_FALSE(publicKeyFromBase64("%%%").has_value());
}

}  // namespace
}  // namespace crypto
}  // namespace hitl
