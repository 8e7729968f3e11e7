#ifndef HITL_AUTH_CALLBACK_LISTENER_H
#define HITL_AUTH_CALLBACK_LISTENER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "hitl/core/compat.h"

struct event_base;
struct evhttp;
struct evhttp_request;

/**
 * @file callback_listener.h
 * @brief Loopback HTTP endpoint receiving the authorization redirect
 */

namespace hitl {
namespace auth {

struct CallbackResult {
  std::string code;
  std::string state;
  std::string error;
  std::string error_description;

  bool isError() const { return !error.empty(); }
};

/**
 * @brief One-shot redirect receiver on libevent's evhttp
 *
 * The socket is bound in the constructor so the redirect URI is known before
 * the authorization URL is built, and released in the destructor on every
 * path.
 */
class CallbackListener {
 public:
  struct Options {
    std::string host;
    uint16_t port;  // 0 picks an ephemeral port
    std::string path;

    Options() : host("127.0.0.1"), port(0), path("/callback") {}
  };

  // Throws HitlError(NETWORK_ERROR) when the address cannot be bound
  explicit CallbackListener(const Options& options = Options());
  ~CallbackListener();

  CallbackListener(const CallbackListener&) = delete;
  CallbackListener& operator=(const CallbackListener&) = delete;

  uint16_t port() const { return port_; }

  // http://<host>:<port><path>
  std::string redirectUri() const;

  /**
   * @brief Serve requests until one redirect arrives
   * @return the redirect parameters, or nullopt on timeout or cancel()
   */
  optional<CallbackResult> waitForRedirect(std::chrono::milliseconds timeout);

  // Safe from any thread; makes a pending or future wait return nullopt
  void cancel();

  bool cancelled() const { return cancelled_.load(); }

 private:
  static void onRequest(struct evhttp_request* req, void* arg);
  void handleRequest(struct evhttp_request* req);

  Options options_;
  uint16_t port_{0};
  struct event_base* base_{nullptr};
  struct evhttp* http_{nullptr};

  std::atomic<bool> cancelled_{false};
  bool received_{false};
  CallbackResult result_;
};

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_CALLBACK_LISTENER_H
