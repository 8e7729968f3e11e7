#include <gtest/gtest.h>

#include <sys/stat.h>

#include <atomic>
#include <thread>
#include <vector>

#include "hitl/core/error.h"
#include "hitl/storage/secure_file.h"

#include "../mocks/temp_dir.h"

namespace hitl {
namespace storage {
namespace {

class SecureFileTest : public ::testing::Test {
 protected:
  test::TempDir dir_;
};

TEST_F(SecureFileTest, WriteAtomicCreatesPrivateFile) {
  std::string path = dir_.file("tokens.json");
  writeAtomic(path, "{\"a\":1}");

  EXPECT_EQ(fileMode(path), 0600);
  auto content = readFile(path);
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, "{\"a\":1}");
}

TEST_F(SecureFileTest, WriteAtomicReplacesWithoutLeftovers) {
  std::string path = dir_.file("tokens.json");
  writeAtomic(path, "first");
  writeAtomic(path, "second, which is longer than the first");

  EXPECT_EQ(*readFile(path), "second, which is longer than the first");
  auto entries = dir_.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0], "tokens.json");
}

TEST_F(SecureFileTest, WriteAtomicTightensExistingLooseFile) {
  std::string path = dir_.file("client.json");
  writeAtomic(path, "old");
  ASSERT_EQ(::chmod(path.c_str(), 0644), 0);

  writeAtomic(path, "new");
  EXPECT_EQ(fileMode(path), 0600);
}

TEST_F(SecureFileTest, WriteAtomicIntoMissingDirectoryFails) {
  try {
    writeAtomic(dir_.file("missing/tokens.json"), "x");
    FAIL() << "expected PERMISSION_ERROR";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::PERMISSION_ERROR);
    EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
  }
}

TEST_F(SecureFileTest, WriteOnceKeepsExistingContent) {
  std::string path = dir_.file("agent_key.json");
  EXPECT_TRUE(writeOnce(path, "original"));
  EXPECT_FALSE(writeOnce(path, "replacement"));

  EXPECT_EQ(*readFile(path), "original");
  EXPECT_EQ(dir_.entries().size(), 1u);
}

TEST_F(SecureFileTest, ConcurrentWriteOnceHasOneWinner) {
  std::string path = dir_.file("agent_key.json");
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      if (writeOnce(path, "writer-" + std::to_string(i))) {
        ++winners;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(readFile(path)->compare(0, 7, "writer-"), 0);
  EXPECT_EQ(dir_.entries().size(), 1u);
}

TEST_F(SecureFileTest, ReadMissingFileReturnsNullopt) {
  EXPECT_FALSE(readFile(dir_.file("nope")).has_value());
  EXPECT_FALSE(fileExists(dir_.file("nope")));
  EXPECT_EQ(fileMode(dir_.file("nope")), -1);
}

TEST_F(SecureFileTest, ReadRejectsGroupReadableFile) {
  std::string path = dir_.file("tokens.json");
  writeAtomic(path, "secret");
  ASSERT_EQ(::chmod(path.c_str(), 0640), 0);

  try {
    readFile(path);
    FAIL() << "expected PERMISSION_ERROR";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::PERMISSION_ERROR);
    EXPECT_NE(std::string(e.what()).find("640"), std::string::npos);
  }

  // Non-secret files may be read regardless
  EXPECT_EQ(*readFile(path, false), "secret");
}

TEST_F(SecureFileTest, RemoveFileReportsWhetherSomethingWasRemoved) {
  std::string path = dir_.file("tokens.json");
  writeAtomic(path, "x");
  EXPECT_TRUE(removeFile(path));
  EXPECT_FALSE(removeFile(path));
  EXPECT_FALSE(fileExists(path));
}

TEST_F(SecureFileTest, EnsureDirectoryCreatesParentsPrivately) {
  std::string nested = dir_.file("a/b/c");
  ensureDirectory(nested);

  struct stat st;
  ASSERT_EQ(::stat(nested.c_str(), &st), 0);
  EXPECT_TRUE(S_ISDIR(st.st_mode));
  EXPECT_EQ(st.st_mode & 0777, 0700u);
  ASSERT_EQ(::stat(dir_.file("a").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST_F(SecureFileTest, EnsureDirectoryTightensExisting) {
  std::string path = dir_.file("config");
  ASSERT_EQ(::mkdir(path.c_str(), 0755), 0);
  ASSERT_EQ(::chmod(path.c_str(), 0755), 0);

  ensureDirectory(path);
  EXPECT_EQ(fileMode(path), 0700);
}

TEST_F(SecureFileTest, EnsureDirectoryRejectsRegularFile) {
  std::string path = dir_.file("plain");
  writeAtomic(path, "x");
  EXPECT_THROW(ensureDirectory(path), HitlError);
  EXPECT_THROW(ensureDirectory(""), HitlError);
}

}  // namespace
}  // namespace storage
}  // namespace hitl
