#ifndef HITL_PROXY_STDIO_SERVER_H
#define HITL_PROXY_STDIO_SERVER_H

#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * @file stdio_server.h
 * @brief Newline-delimited JSON-RPC over a pair of file descriptors
 */

namespace hitl {
namespace proxy {

/**
 * @brief Line transport for the local MCP client
 *
 * A dedicated reader thread delivers one complete line at a time; writes are
 * serialized so concurrent replies never interleave. stdout carries protocol
 * traffic only.
 */
class StdioServer {
 public:
  using LineHandler = std::function<void(std::string)>;

  struct Options {
    int input_fd = STDIN_FILENO;
    int output_fd = STDOUT_FILENO;
    size_t max_line_bytes = 16 * 1024 * 1024;
  };

  StdioServer();
  explicit StdioServer(const Options& options);
  ~StdioServer();

  StdioServer(const StdioServer&) = delete;
  StdioServer& operator=(const StdioServer&) = delete;

  // Starts the reader thread; empty lines are skipped
  void start(LineHandler on_line);

  // Blocks until the input reaches EOF or stop() is called
  void wait();

  // Wakes the reader thread; safe from any thread
  void stop();

  /**
   * @brief Write one message followed by '\n'
   * @return false once the output side is closed
   */
  bool writeLine(const std::string& line);

  bool reachedEof() const { return eof_.load(); }

 private:
  void readLoop();
  void finish();

  Options options_;
  int wake_pipe_[2];
  LineHandler on_line_;
  std::thread reader_;

  std::mutex write_mutex_;
  bool output_closed_{false};

  std::mutex state_mutex_;
  std::condition_variable done_cv_;
  bool done_{false};
  std::atomic<bool> eof_{false};
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_STDIO_SERVER_H
