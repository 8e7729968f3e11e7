#ifndef HITL_PROXY_EXCHANGE_TRACKER_H
#define HITL_PROXY_EXCHANGE_TRACKER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace hitl {
namespace proxy {

enum class ExchangeTarget { PLAINTEXT, ENCRYPTED };

/**
 * @brief One intercepted call, alive until its reply is delivered
 */
struct ProxyExchange {
  uint64_t correlation_id;
  std::string tool_name;
  nlohmann::json client_request_id;
  ExchangeTarget target;
  std::string plaintext;  // wiped on destruction

  ProxyExchange(uint64_t id,
                std::string tool,
                nlohmann::json client_id,
                ExchangeTarget t)
      : correlation_id(id),
        tool_name(std::move(tool)),
        client_request_id(std::move(client_id)),
        target(t) {}
  ~ProxyExchange();

  // True for exactly one caller; that caller owns the reply
  bool tryComplete() {
    bool expected = false;
    return completed_.compare_exchange_strong(expected, true);
  }

  bool completed() const { return completed_.load(); }

 private:
  std::atomic<bool> completed_{false};
};

/**
 * @brief Outstanding exchanges keyed by correlation id
 *
 * Ids come from a process-wide counter and are never reused.
 */
class ExchangeTracker {
 public:
  std::shared_ptr<ProxyExchange> open(const std::string& tool_name,
                                      const nlohmann::json& client_request_id,
                                      ExchangeTarget target);

  void close(uint64_t correlation_id);

  std::shared_ptr<ProxyExchange> find(uint64_t correlation_id) const;

  // Removes and returns every outstanding exchange
  std::vector<std::shared_ptr<ProxyExchange>> drain();

  size_t outstanding() const;

 private:
  static std::atomic<uint64_t> next_id_;

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<ProxyExchange>> exchanges_;
};

}  // namespace proxy
}  // namespace hitl

#endif  // HITL_PROXY_EXCHANGE_TRACKER_H
