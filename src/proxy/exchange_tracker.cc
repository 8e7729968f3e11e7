#include "hitl/proxy/exchange_tracker.h"

#include <openssl/crypto.h>

namespace hitl {
namespace proxy {

std::atomic<uint64_t> ExchangeTracker::next_id_{1};

ProxyExchange::~ProxyExchange() {
  if (!plaintext.empty()) {
    OPENSSL_cleanse(&plaintext[0], plaintext.size());
  }
}

std::shared_ptr<ProxyExchange> ExchangeTracker::open(
    const std::string& tool_name,
    const nlohmann::json& client_request_id,
    ExchangeTarget target) {
  auto exchange = std::make_shared<ProxyExchange>(
      next_id_.fetch_add(1), tool_name, client_request_id, target);
  std::lock_guard<std::mutex> lock(mutex_);
  exchanges_[exchange->correlation_id] = exchange;
  return exchange;
}

void ExchangeTracker::close(uint64_t correlation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  exchanges_.erase(correlation_id);
}

std::shared_ptr<ProxyExchange> ExchangeTracker::find(
    uint64_t correlation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = exchanges_.find(correlation_id);
  return it == exchanges_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ProxyExchange>> ExchangeTracker::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<ProxyExchange>> drained;
  drained.reserve(exchanges_.size());
  for (auto& entry : exchanges_) {
    drained.push_back(entry.second);
  }
  exchanges_.clear();
  return drained;
}

size_t ExchangeTracker::outstanding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exchanges_.size();
}

}  // namespace proxy
}  // namespace hitl
