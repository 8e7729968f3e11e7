#define HITL_LOG_COMPONENT "http"

#include "hitl/http/http_client.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

#include "hitl/core/error.h"
#include "hitl/http/url.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace http {

namespace {

std::once_flag curl_init_once;

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t headerCallback(char* buffer,
                      size_t size,
                      size_t nitems,
                      void* userdata) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  std::string header(buffer, size * nitems);

  // A new status line starts a new header block (redirects, 100-continue)
  if (header.compare(0, 5, "HTTP/") == 0) {
    headers->clear();
    return size * nitems;
  }

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (!name.empty()) {
      (*headers)[toLower(name)] = value;
    }
  }

  return size * nitems;
}

struct ProgressState {
  const std::atomic<uint64_t>* generation_counter;
  const std::atomic<bool>* closed;
  uint64_t generation;
};

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp,
                     curl_off_t /*dltotal*/,
                     curl_off_t /*dlnow*/,
                     curl_off_t /*ultotal*/,
                     curl_off_t /*ulnow*/) {
  auto* state = static_cast<ProgressState*>(clientp);
  return state->closed->load() ||
                 state->generation_counter->load() != state->generation
             ? 1
             : 0;
}

bool isRetryableCurlError(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_GOT_NOTHING:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
      return true;
    default:
      return false;
  }
}

// The request never left this host
bool nothingSent(CURLcode code) {
  return code == CURLE_COULDNT_CONNECT || code == CURLE_COULDNT_RESOLVE_HOST ||
         code == CURLE_COULDNT_RESOLVE_PROXY;
}

}  // namespace

const char* methodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::PUT: return "PUT";
    case HttpMethod::DELETE: return "DELETE";
  }
  return "GET";
}

Authorization Authorization::bearer(const std::string& token) {
  return Authorization{"Authorization", "Bearer " + token};
}

Authorization Authorization::apiKey(const std::string& key) {
  return Authorization{"X-API-Key", key};
}

std::string Authorization::bearerToken() const {
  static const std::string kPrefix = "Bearer ";
  if (header != "Authorization" ||
      value.compare(0, kPrefix.size(), kPrefix) != 0) {
    return std::string();
  }
  return value.substr(kPrefix.size());
}

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool RetryPolicy::isRetryableStatus(int status_code) {
  return (status_code >= 500 && status_code < 600) ||
         status_code == 408 ||  // Request Timeout
         status_code == 429;    // Too Many Requests
}

std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const {
  double base = static_cast<double>(initial_delay.count()) *
                std::pow(backoff_multiplier, attempt);
  int64_t delay_ms = static_cast<int64_t>(
      std::min(base, static_cast<double>(max_delay.count())));

  if (jitter.count() > 0) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dis(0, jitter.count());
    delay_ms += dis(gen);
  }
  return std::chrono::milliseconds(delay_ms);
}

struct CurlHttpClient::Attempt {
  HttpResponse response;
  CURLcode code = CURLE_OK;
};

CurlHttpClient::CurlHttpClient(const Config& config) : config_(config) {
  std::call_once(curl_init_once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlHttpClient::~CurlHttpClient() { cancelAll(); }

void CurlHttpClient::cancelAll() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    ++generation_;
  }
  wait_cv_.notify_all();
}

void CurlHttpClient::close() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    closed_ = true;
    ++generation_;
  }
  wait_cv_.notify_all();
}

bool CurlHttpClient::isCancelled(uint64_t generation) const {
  return closed_.load() || generation_.load() != generation;
}

bool CurlHttpClient::sleepUnlessCancelled(std::chrono::milliseconds delay,
                                          uint64_t generation) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, delay,
                    [this, generation]() { return isCancelled(generation); });
  return !isCancelled(generation);
}

CurlHttpClient::Attempt CurlHttpClient::performOnce(const HttpRequest& request,
                                                    uint64_t generation) {
  auto start = std::chrono::steady_clock::now();
  Attempt attempt;

  CURL* curl = curl_easy_init();
  if (!curl) {
    throw HitlError(ErrorCode::NETWORK_ERROR, "Failed to initialize CURL");
  }

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

  switch (request.method) {
    case HttpMethod::POST:
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      break;
    case HttpMethod::PUT:
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
      break;
    case HttpMethod::DELETE:
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
      break;
    default:  // GET
      break;
  }

  if (request.method != HttpMethod::GET) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  }

  struct curl_slist* headers = nullptr;
  for (const auto& header_pair : request.headers) {
    std::string header = header_pair.first + ": " + header_pair.second;
    headers = curl_slist_append(headers, header.c_str());
  }
  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
  if (!config_.ca_bundle_path.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                   request.follow_redirects ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS,
                   static_cast<long>(request.max_redirects));

  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(config_.connection_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &attempt.response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &attempt.response.headers);

  ProgressState progress{&generation_, &closed_, generation};
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

  attempt.code = curl_easy_perform(curl);

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  attempt.response.status_code = static_cast<int>(http_code);

  attempt.response.latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);

  if (headers) {
    curl_slist_free_all(headers);
  }
  curl_easy_cleanup(curl);

  return attempt;
}

HttpResponse CurlHttpClient::request(const HttpRequest& request) {
  const uint64_t generation = generation_.load();
  const std::string target = redactQuery(request.url);

  for (int attempt = 0;; ++attempt) {
    if (closed_.load()) {
      throw HitlError(ErrorCode::CANCELLED,
                      std::string("Client closed, not sending: ") + target);
    }
    Attempt result = performOnce(request, generation);

    if (isCancelled(generation) ||
        result.code == CURLE_ABORTED_BY_CALLBACK) {
      throw HitlError(ErrorCode::CANCELLED,
                      std::string("Request cancelled: ") + target);
    }

    bool transport_failed = result.code != CURLE_OK;
    bool retry;
    if (transport_failed) {
      retry = isRetryableCurlError(result.code) &&
              (request.idempotent || nothingSent(result.code));
    } else {
      retry = request.idempotent &&
              RetryPolicy::isRetryableStatus(result.response.status_code);
    }

    if (!retry || attempt >= config_.retry.max_retries) {
      if (transport_failed) {
        throw HitlError(ErrorCode::NETWORK_ERROR,
                        std::string(methodToString(request.method)) + " " +
                            target + " failed: " +
                            curl_easy_strerror(result.code));
      }
      HITL_LOG(Debug, "{} {} -> {} ({}ms)", methodToString(request.method),
               target, result.response.status_code,
               result.response.latency.count());
      return std::move(result.response);
    }

    auto delay = config_.retry.delayForAttempt(attempt);
    HITL_LOG(Warning, "{} {} attempt {} failed ({}), retrying in {}ms",
             methodToString(request.method), target, attempt + 1,
             transport_failed ? curl_easy_strerror(result.code)
                              : std::to_string(result.response.status_code),
             delay.count());

    if (!sleepUnlessCancelled(delay, generation)) {
      throw HitlError(ErrorCode::CANCELLED,
                      std::string("Request cancelled: ") + target);
    }
  }
}

}  // namespace http
}  // namespace hitl
