#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <mutex>
#include <string>
#include <vector>

#include "hitl/proxy/stdio_server.h"

namespace hitl {
namespace proxy {
namespace {

class StdioServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ::signal(SIGPIPE, SIG_IGN);
    ASSERT_EQ(::pipe(input_), 0);
    ASSERT_EQ(::pipe(output_), 0);
  }

  void TearDown() override {
    for (int fd : {input_[0], input_[1], output_[0], output_[1]}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  StdioServer::Options options(size_t max_line_bytes = 1024) const {
    StdioServer::Options opts;
    opts.input_fd = input_[0];
    opts.output_fd = output_[1];
    opts.max_line_bytes = max_line_bytes;
    return opts;
  }

  void feed(const std::string& data) {
    ASSERT_EQ(::write(input_[1], data.data(), data.size()),
              static_cast<ssize_t>(data.size()));
  }

  void closeInput() {
    ::close(input_[1]);
    input_[1] = -1;
  }

  std::vector<std::string> collect(StdioServer& server) {
    server.start([this](std::string line) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.push_back(std::move(line));
    });
    server.wait();
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  int input_[2] = {-1, -1};
  int output_[2] = {-1, -1};
  std::mutex mutex_;
  std::vector<std::string> lines_;
};

TEST_F(StdioServerTest, DeliversCompleteLines) {
  StdioServer server(options());
  feed("{\"id\":1}\n{\"id\":2}\n");
  closeInput();

  auto lines = collect(server);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "{\"id\":1}");
  EXPECT_EQ(lines[1], "{\"id\":2}");
  EXPECT_TRUE(server.reachedEof());
}

TEST_F(StdioServerTest, StripsCarriageReturnAndSkipsBlankLines) {
  StdioServer server(options());
  feed("first\r\n\n\r\nsecond\n");
  closeInput();

  auto lines = collect(server);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "first");
  EXPECT_EQ(lines[1], "second");
}

TEST_F(StdioServerTest, TrailingLineWithoutNewlineIsDeliveredAtEof) {
  StdioServer server(options());
  feed("one\ntwo");
  closeInput();

  auto lines = collect(server);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[1], "two");
}

TEST_F(StdioServerTest, OversizeLinesAreDropped) {
  StdioServer server(options(8));
  feed("short\n0123456789abcdef\nnext\n");
  closeInput();

  auto lines = collect(server);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "short");
  EXPECT_EQ(lines[1], "next");
}

TEST_F(StdioServerTest, StopUnblocksIdleReader) {
  StdioServer server(options());
  server.start([](std::string) {});
  server.stop();
  server.wait();
  EXPECT_FALSE(server.reachedEof());
}

TEST_F(StdioServerTest, WriteLineAppendsNewline) {
  StdioServer server(options());
  EXPECT_TRUE(server.writeLine("{\"result\":{}}"));

  char buffer[64] = {};
  ssize_t n = ::read(output_[0], buffer, sizeof(buffer));
  EXPECT_EQ(std::string(buffer, n), "{\"result\":{}}\n");
}

TEST_F(StdioServerTest, WriteFailsOnceClientIsGone) {
  StdioServer server(options());
  ::close(output_[0]);
  output_[0] = -1;

  EXPECT_FALSE(server.writeLine("lost"));
  EXPECT_FALSE(server.writeLine("still lost"));
}

}  // namespace
}  // namespace proxy
}  // namespace hitl
