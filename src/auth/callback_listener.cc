#define HITL_LOG_COMPONENT "auth"

#include "hitl/auth/callback_listener.h"

#include <arpa/inet.h>
#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <mutex>

#include "hitl/core/error.h"
#include "hitl/http/url.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace auth {

namespace {

// cancel() is called from other threads, so bases must be notifiable
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

std::string htmlEscape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c; break;
    }
  }
  return out;
}

void sendPage(struct evhttp_request* req,
              int status,
              const char* reason,
              const std::string& html) {
  struct evbuffer* buf = evbuffer_new();
  if (!buf) {
    evhttp_send_error(req, HTTP_INTERNAL, nullptr);
    return;
  }
  evbuffer_add(buf, html.data(), html.size());
  struct evkeyvalq* headers = evhttp_request_get_output_headers(req);
  evhttp_add_header(headers, "Content-Type", "text/html; charset=utf-8");
  evhttp_add_header(headers, "Cache-Control", "no-store");
  evhttp_add_header(headers, "Connection", "close");
  evhttp_send_reply(req, status, reason, buf);
  evbuffer_free(buf);
}

timeval toTimeval(std::chrono::milliseconds ms) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

}  // namespace

CallbackListener::CallbackListener(const Options& options) : options_(options) {
  ensureLibeventThreadingInitialized();

  base_ = event_base_new();
  if (!base_) {
    throw HitlError(ErrorCode::NETWORK_ERROR, "Failed to create event base");
  }
  http_ = evhttp_new(base_);
  if (!http_) {
    event_base_free(base_);
    throw HitlError(ErrorCode::NETWORK_ERROR, "Failed to create HTTP server");
  }
  evhttp_set_allowed_methods(http_, EVHTTP_REQ_GET);
  evhttp_set_gencb(http_, &CallbackListener::onRequest, this);

  struct evhttp_bound_socket* handle = evhttp_bind_socket_with_handle(
      http_, options_.host.c_str(), options_.port);
  if (!handle) {
    evhttp_free(http_);
    event_base_free(base_);
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Cannot listen on " + options_.host + ":" +
                        std::to_string(options_.port));
  }

  // Read back the ephemeral port
  evutil_socket_t fd = evhttp_bound_socket_get_fd(handle);
  struct sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    if (addr.ss_family == AF_INET) {
      port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
    } else if (addr.ss_family == AF_INET6) {
      port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
    }
  }
  if (port_ == 0) {
    evhttp_free(http_);
    event_base_free(base_);
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Cannot determine callback listener port");
  }

  HITL_LOG(Debug, "Callback listener bound to {}", redirectUri());
}

CallbackListener::~CallbackListener() {
  if (http_) {
    evhttp_free(http_);
  }
  if (base_) {
    event_base_free(base_);
  }
  HITL_LOG(Debug, "Callback listener on port {} released", port_);
}

std::string CallbackListener::redirectUri() const {
  std::string host = options_.host;
  if (host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }
  return "http://" + host + ":" + std::to_string(port_) + options_.path;
}

optional<CallbackResult> CallbackListener::waitForRedirect(
    std::chrono::milliseconds timeout) {
  if (received_) {
    return result_;
  }
  if (cancelled_.load()) {
    return nullopt;
  }

  timeval tv = toTimeval(timeout);
  event_base_loopexit(base_, &tv);
  event_base_dispatch(base_);

  if (received_ && !cancelled_.load()) {
    return result_;
  }
  if (cancelled_.load()) {
    HITL_LOG(Info, "Waiting for authorization redirect cancelled");
  } else {
    HITL_LOG(Warning, "No authorization redirect within {}s",
             std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
  }
  return nullopt;
}

void CallbackListener::cancel() {
  cancelled_.store(true);
  // Queued rather than flagged, so it also ends a dispatch that has not
  // started yet
  event_base_loopexit(base_, nullptr);
}

void CallbackListener::onRequest(struct evhttp_request* req, void* arg) {
  static_cast<CallbackListener*>(arg)->handleRequest(req);
}

void CallbackListener::handleRequest(struct evhttp_request* req) {
  const struct evhttp_uri* uri = evhttp_request_get_evhttp_uri(req);
  const char* path = uri ? evhttp_uri_get_path(uri) : nullptr;
  if (!path || options_.path != path) {
    evhttp_send_error(req, HTTP_NOTFOUND, nullptr);
    return;
  }

  if (received_) {
    sendPage(req, HTTP_OK, "OK",
             "<html><body><h1>Already handled</h1>"
             "<p>You can close this window.</p></body></html>");
    return;
  }

  const char* query = evhttp_uri_get_query(uri);
  auto params = http::parseQuery(query ? query : "");

  CallbackResult result;
  result.code = params["code"];
  result.state = params["state"];
  result.error = params["error"];
  result.error_description = params["error_description"];

  if (result.code.empty() && result.error.empty()) {
    sendPage(req, HTTP_BADREQUEST, "Bad Request",
             "<html><body><h1>Invalid callback</h1>"
             "<p>Missing code or error parameter.</p></body></html>");
    return;
  }

  if (result.isError()) {
    HITL_LOG(Warning, "Authorization server returned error: {}", result.error);
    sendPage(req, HTTP_OK, "OK",
             "<html><body><h1>Authentication Failed</h1><p>Error: " +
                 htmlEscape(result.error) +
                 "</p><p>You can close this window.</p></body></html>");
  } else {
    HITL_LOG(Debug, "Authorization code received");
    sendPage(req, HTTP_OK, "OK",
             "<html><body><h1>Authentication Successful</h1>"
             "<p>You can close this window and return to the CLI.</p>"
             "</body></html>");
  }

  result_ = result;
  received_ = true;

  // Give the reply a moment to flush before the loop stops
  timeval flush = toTimeval(std::chrono::milliseconds(100));
  event_base_loopexit(base_, &flush);
}

}  // namespace auth
}  // namespace hitl
