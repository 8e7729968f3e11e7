#ifndef HITL_PROXY_PROXY_SERVER_H
#define HITL_PROXY_PROXY_SERVER_H

#include <atomic>
#include <mutex>

#include "hitl/proxy/encrypting_proxy.h"
#include "hitl/proxy/stdio_server.h"

namespace hitl {
namespace proxy {

/**
 * @brief Runs an EncryptingProxy behind a StdioServer
 *
 * Each client line is handled on the worker pool. At input EOF the queued
 * work is allowed to finish; stop() cancels it instead.
 */
class ProxyServer {
 public:
  ProxyServer(EncryptingProxy& proxy, StdioServer& io, size_t worker_threads);

  // Blocks until the client input closes or stop() is called
  void run();

  // Cancels outstanding exchanges and unblocks run(); any thread
  void stop();

  size_t handledMessages() const { return handled_.load(); }

 private:
  void writeReplies(const std::vector<nlohmann::json>& replies);

  EncryptingProxy& proxy_;
  StdioServer& io_;
  size_t worker_threads_;
  std::atomic<size_t> handled_{0};
  std::once_flag stop_once_;
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_PROXY_SERVER_H
