#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "hitl/core/clock.h"
#include "hitl/core/error.h"
#include "hitl/http/http_client.h"

namespace hitl {
namespace test {

class MockHttpTransport : public http::HttpTransport {
 public:
  MOCK_METHOD(http::HttpResponse,
              request,
              (const http::HttpRequest& request),
              (override));
  MOCK_METHOD(void, cancelAll, (), (override));
  MOCK_METHOD(void, close, (), (override));
};

/**
 * Scripted transport: every request is recorded and answered by a handler
 * chosen by the test. With no handler installed requests fail like an
 * unreachable host.
 */
class FakeHttpTransport : public http::HttpTransport {
 public:
  using Handler = std::function<http::HttpResponse(const http::HttpRequest&)>;

  void setHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  http::HttpResponse request(const http::HttpRequest& request) override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        throw HitlError(ErrorCode::CANCELLED, "transport closed");
      }
      requests_.push_back(request);
      handler = handler_;
    }
    if (!handler) {
      throw HitlError(ErrorCode::NETWORK_ERROR, "no route to " + request.url);
    }
    return handler(request);
  }

  void cancelAll() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cancel_calls_;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    ++cancel_calls_;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::vector<http::HttpRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  // Requests whose URL contains the fragment
  size_t count(const std::string& url_fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& r : requests_) {
      if (r.url.find(url_fragment) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }

  // cancelAll() and close() calls
  int cancelCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_calls_;
  }

  void clearRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
  }

 private:
  mutable std::mutex mutex_;
  Handler handler_;
  std::vector<http::HttpRequest> requests_;
  int cancel_calls_{0};
  bool closed_{false};
};

inline http::HttpResponse jsonResponse(int status, const nlohmann::json& body) {
  http::HttpResponse response;
  response.status_code = status;
  response.headers["content-type"] = "application/json";
  response.body = body.dump();
  return response;
}

inline http::HttpResponse textResponse(int status, const std::string& body) {
  http::HttpResponse response;
  response.status_code = status;
  response.headers["content-type"] = "text/plain";
  response.body = body;
  return response;
}

// Manually advanced clock shared with a Context
class ManualClock {
 public:
  explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
      : now_(std::make_shared<TimePoint>(start)),
        mutex_(std::make_shared<std::mutex>()) {}

  Clock clock() const {
    auto now = now_;
    auto mutex = mutex_;
    return [now, mutex]() {
      std::lock_guard<std::mutex> lock(*mutex);
      return *now;
    };
  }

  void advance(std::chrono::seconds delta) {
    std::lock_guard<std::mutex> lock(*mutex_);
    *now_ += delta;
  }

  TimePoint now() const {
    std::lock_guard<std::mutex> lock(*mutex_);
    return *now_;
  }

 private:
  std::shared_ptr<TimePoint> now_;
  std::shared_ptr<std::mutex> mutex_;
};

}  // namespace test
}  // namespace hitl
