#ifndef HITL_HTTP_HTTP_CLIENT_H
#define HITL_HTTP_HTTP_CLIENT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @file http_client.h
 * @brief Blocking HTTP transport used by the auth flow and the proxy
 */

namespace hitl {
namespace http {

/**
 * @brief HTTP request method
 */
enum class HttpMethod { GET, POST, PUT, DELETE };

const char* methodToString(HttpMethod method);

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
  std::string url;
  HttpMethod method;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout;
  bool verify_ssl;
  bool follow_redirects;
  int max_redirects;
  // Non-idempotent requests are only retried when nothing reached the server
  bool idempotent;

  HttpRequest()
      : method(HttpMethod::GET),
        timeout(30),
        verify_ssl(true),
        follow_redirects(true),
        max_redirects(10),
        idempotent(true) {}
};

/**
 * @brief Credential header attached to backend and relay calls
 */
struct Authorization {
  std::string header;
  std::string value;

  // "Authorization: Bearer <token>"
  static Authorization bearer(const std::string& token);
  // "X-API-Key: <key>"
  static Authorization apiKey(const std::string& key);

  // Token of a bearer authorization, empty for any other kind
  std::string bearerToken() const;

  void applyTo(HttpRequest& request) const { request.headers[header] = value; }

  bool operator==(const Authorization& other) const {
    return header == other.header && value == other.value;
  }
};

/**
 * @brief HTTP response structure
 *
 * Header names are stored lower-cased.
 */
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds latency{0};

  bool isSuccess() const { return status_code >= 200 && status_code < 300; }
  bool isClientError() const { return status_code >= 400 && status_code < 500; }

  // Empty string when absent; name is matched case-insensitively
  std::string header(const std::string& name) const;
};

/**
 * @brief Transport seam
 *
 * request() returns any HTTP response, including 4xx/5xx. Failures where no
 * usable response exists raise HitlError(NETWORK_ERROR); requests aborted by
 * cancelAll() or close() raise HitlError(CANCELLED).
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse request(const HttpRequest& request) = 0;

  // Aborts every in-flight transfer and pending retry
  virtual void cancelAll() = 0;

  // cancelAll() that sticks: every later request() fails with CANCELLED
  virtual void close() = 0;
};

/**
 * @brief Bounded exponential backoff with jitter
 */
struct RetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{16000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds jitter{500};

  static RetryPolicy none() {
    RetryPolicy policy;
    policy.max_retries = 0;
    return policy;
  }

  // 5xx, 408 and 429
  static bool isRetryableStatus(int status_code);

  std::chrono::milliseconds delayForAttempt(int attempt) const;
};

/**
 * @brief libcurl implementation of HttpTransport
 */
class CurlHttpClient : public HttpTransport {
 public:
  struct Config {
    std::chrono::seconds connection_timeout;
    std::string ca_bundle_path;
    std::string user_agent;
    RetryPolicy retry;

    Config() : connection_timeout(10), user_agent("hitl-cli/1.0") {}
  };

  explicit CurlHttpClient(const Config& config = Config());
  ~CurlHttpClient() override;

  HttpResponse request(const HttpRequest& request) override;
  void cancelAll() override;
  void close() override;

 private:
  struct Attempt;

  Attempt performOnce(const HttpRequest& request, uint64_t generation);
  bool isCancelled(uint64_t generation) const;
  bool sleepUnlessCancelled(std::chrono::milliseconds delay,
                            uint64_t generation);

  Config config_;
  std::atomic<uint64_t> generation_{0};
  std::atomic<bool> closed_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

}  // namespace http
}  // namespace hitl

#endif  // HITL_HTTP_HTTP_CLIENT_H
