#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "hitl/core/error.h"
#include "hitl/http/http_client.h"

namespace hitl {
namespace http {
namespace {

// Serves one canned response per accepted connection, then closes it
class ScriptedServer {
 public:
  explicit ScriptedServer(std::vector<std::string> responses)
      : responses_(std::move(responses)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 8);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this]() { serve(); });
  }

  ~ScriptedServer() {
    stopping_ = true;
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::vector<std::string> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  void serve() {
    for (const auto& response : responses_) {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      std::string request = readRequest(client);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
      }
      ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
      ::close(client);
      if (stopping_) {
        return;
      }
    }
  }

  static std::string readRequest(int client) {
    std::string data;
    char buffer[4096];
    size_t header_end = std::string::npos;
    size_t expected = 0;
    for (;;) {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      data.append(buffer, static_cast<size_t>(n));
      if (header_end == std::string::npos) {
        header_end = data.find("\r\n\r\n");
        if (header_end != std::string::npos) {
          size_t cl = data.find("Content-Length: ");
          if (cl != std::string::npos && cl < header_end) {
            expected = std::strtoul(data.c_str() + cl + 16, nullptr, 10);
          }
        }
      }
      if (header_end != std::string::npos &&
          data.size() >= header_end + 4 + expected) {
        break;
      }
    }
    return data;
  }

  int fd_ = -1;
  uint16_t port_ = 0;
  std::vector<std::string> responses_;
  std::mutex mutex_;
  std::vector<std::string> requests_;
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

// Completes TCP handshakes through the backlog but never answers
class SilentServer {
 public:
  SilentServer() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 8);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~SilentServer() { ::close(fd_); }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
};

std::string response(int status,
                     const std::string& body,
                     const std::string& extra_headers = "") {
  return "HTTP/1.1 " + std::to_string(status) + " Status\r\n" +
         "Content-Type: application/json\r\n" + extra_headers +
         "Content-Length: " + std::to_string(body.size()) +
         "\r\nConnection: close\r\n\r\n" + body;
}

CurlHttpClient::Config fastRetries(int max_retries) {
  CurlHttpClient::Config config;
  config.retry.max_retries = max_retries;
  config.retry.initial_delay = std::chrono::milliseconds(10);
  config.retry.max_delay = std::chrono::milliseconds(20);
  config.retry.jitter = std::chrono::milliseconds(0);
  return config;
}

// Port that had a listener a moment ago and now refuses connections
uint16_t closedPort() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

TEST(RetryPolicyTest, RetryableStatuses) {
  EXPECT_TRUE(RetryPolicy::isRetryableStatus(500));
  EXPECT_TRUE(RetryPolicy::isRetryableStatus(503));
  EXPECT_TRUE(RetryPolicy::isRetryableStatus(408));
  EXPECT_TRUE(RetryPolicy::isRetryableStatus(429));
  EXPECT_FALSE(RetryPolicy::isRetryableStatus(200));
  EXPECT_FALSE(RetryPolicy::isRetryableStatus(400));
  EXPECT_FALSE(RetryPolicy::isRetryableStatus(401));
  EXPECT_FALSE(RetryPolicy::isRetryableStatus(404));
}

TEST(RetryPolicyTest, DelayGrowsAndIsCapped) {
  RetryPolicy policy;
  policy.jitter = std::chrono::milliseconds(0);
  EXPECT_EQ(policy.delayForAttempt(0).count(), 1000);
  EXPECT_EQ(policy.delayForAttempt(1).count(), 2000);
  EXPECT_EQ(policy.delayForAttempt(3).count(), 8000);
  EXPECT_EQ(policy.delayForAttempt(10).count(), 16000);
}

TEST(RetryPolicyTest, JitterStaysInBounds) {
  RetryPolicy policy;
  for (int i = 0; i < 50; ++i) {
    auto delay = policy.delayForAttempt(0).count();
    EXPECT_GE(delay, 1000);
    EXPECT_LE(delay, 1500);
  }
  EXPECT_EQ(RetryPolicy::none().max_retries, 0);
}

TEST(CurlHttpClientTest, ReturnsBodyAndLowerCasedHeaders) {
  ScriptedServer server({response(200, "{\"ok\":true}", "X-Session-Id: s1\r\n")});
  CurlHttpClient client(fastRetries(0));

  HttpRequest request;
  request.url = server.url("/ping?secret=1");
  HttpResponse result = client.request(request);

  EXPECT_EQ(result.status_code, 200);
  EXPECT_TRUE(result.isSuccess());
  EXPECT_EQ(result.body, "{\"ok\":true}");
  EXPECT_EQ(result.headers.count("x-session-id"), 1u);
  EXPECT_EQ(result.header("X-Session-ID"), "s1");
  EXPECT_EQ(result.header("missing"), "");
}

TEST(CurlHttpClientTest, PostSendsBodyAndHeaders) {
  ScriptedServer server({response(201, "{}")});
  CurlHttpClient client(fastRetries(0));

  HttpRequest request;
  request.url = server.url("/register");
  request.method = HttpMethod::POST;
  request.headers["Content-Type"] = "application/json";
  request.body = "{\"client_name\":\"agent\"}";
  EXPECT_EQ(client.request(request).status_code, 201);

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].compare(0, 15, "POST /register "), 0);
  EXPECT_NE(requests[0].find("Content-Type: application/json"),
            std::string::npos);
  EXPECT_NE(requests[0].find("{\"client_name\":\"agent\"}"), std::string::npos);
}

TEST(CurlHttpClientTest, RetriesIdempotentRequestOnServerError) {
  ScriptedServer server({response(503, "busy"), response(200, "done")});
  CurlHttpClient client(fastRetries(3));

  HttpRequest request;
  request.url = server.url("/keys");
  HttpResponse result = client.request(request);

  EXPECT_EQ(result.status_code, 200);
  EXPECT_EQ(result.body, "done");
  EXPECT_EQ(server.requests().size(), 2u);
}

TEST(CurlHttpClientTest, DoesNotRetryNonIdempotentRequest) {
  ScriptedServer server({response(503, "busy"), response(200, "done")});
  CurlHttpClient client(fastRetries(3));

  HttpRequest request;
  request.url = server.url("/token");
  request.method = HttpMethod::POST;
  request.idempotent = false;
  HttpResponse result = client.request(request);

  EXPECT_EQ(result.status_code, 503);
  EXPECT_EQ(server.requests().size(), 1u);
}

TEST(CurlHttpClientTest, ReturnsLastResponseWhenRetriesRunOut) {
  ScriptedServer server(
      {response(502, "a"), response(502, "b"), response(502, "c")});
  CurlHttpClient client(fastRetries(2));

  HttpRequest request;
  request.url = server.url("/keys");
  HttpResponse result = client.request(request);

  EXPECT_EQ(result.status_code, 502);
  EXPECT_EQ(result.body, "c");
  EXPECT_EQ(server.requests().size(), 3u);
}

TEST(CurlHttpClientTest, ClientErrorsAreReturnedNotThrown) {
  ScriptedServer server({response(401, "{\"error\":\"invalid_token\"}")});
  CurlHttpClient client(fastRetries(3));

  HttpRequest request;
  request.url = server.url("/keys");
  HttpResponse result = client.request(request);

  EXPECT_EQ(result.status_code, 401);
  EXPECT_TRUE(result.isClientError());
  EXPECT_EQ(server.requests().size(), 1u);
}

TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
  CurlHttpClient client(fastRetries(1));

  HttpRequest request;
  request.url = "http://127.0.0.1:" + std::to_string(closedPort()) + "/x";
  try {
    client.request(request);
    FAIL() << "expected NETWORK_ERROR";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NETWORK_ERROR);
  }
}

TEST(CurlHttpClientTest, CancelAllInterruptsRetryBackoff) {
  CurlHttpClient::Config config = fastRetries(5);
  config.retry.initial_delay = std::chrono::milliseconds(5000);
  config.retry.max_delay = std::chrono::milliseconds(5000);
  CurlHttpClient client(config);

  ScriptedServer server({response(503, "busy"), response(503, "busy")});
  HttpRequest request;
  request.url = server.url("/keys");

  std::thread canceller([&client]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    client.cancelAll();
  });

  auto start = std::chrono::steady_clock::now();
  try {
    client.request(request);
    ADD_FAILURE() << "expected CANCELLED";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
  }
  canceller.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST(CurlHttpClientTest, RequestAfterCloseIsCancelledWithoutWaiting) {
  CurlHttpClient::Config config = fastRetries(0);
  config.connection_timeout = std::chrono::seconds(3);
  CurlHttpClient client(config);
  client.close();

  SilentServer server;
  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = server.url("/mcp");
  request.body = "{}";

  auto start = std::chrono::steady_clock::now();
  try {
    client.request(request);
    ADD_FAILURE() << "expected CANCELLED";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(500));
}

TEST(CurlHttpClientTest, CancelAllDoesNotBlockLaterRequests) {
  CurlHttpClient client(fastRetries(0));
  client.cancelAll();

  ScriptedServer server({response(200, "{}")});
  HttpRequest request;
  request.url = server.url("/ok");
  EXPECT_EQ(client.request(request).status_code, 200);
}

TEST(CurlHttpClientTest, CloseAbortsTransferWaitingOnSilentServer) {
  CurlHttpClient::Config config = fastRetries(0);
  config.connection_timeout = std::chrono::seconds(10);
  CurlHttpClient client(config);

  SilentServer server;
  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = server.url("/mcp");
  request.body = "{}";

  std::thread closer([&client]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    client.close();
  });

  auto start = std::chrono::steady_clock::now();
  try {
    client.request(request);
    ADD_FAILURE() << "expected CANCELLED";
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
  }
  closer.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(HttpMethodTest, Names) {
  EXPECT_STREQ(methodToString(HttpMethod::GET), "GET");
  EXPECT_STREQ(methodToString(HttpMethod::POST), "POST");
  EXPECT_STREQ(methodToString(HttpMethod::PUT), "PUT");
  EXPECT_STREQ(methodToString(HttpMethod::DELETE), "DELETE");
}

}  // namespace
}  // namespace http
}  // namespace hitl
