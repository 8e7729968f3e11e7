#define HITL_LOG_COMPONENT "proxy"

#include "hitl/proxy/proxy_server.h"

#include "hitl/logging/log_macros.h"
#include "hitl/proxy/worker_pool.h"

namespace hitl {
namespace proxy {

ProxyServer::ProxyServer(EncryptingProxy& proxy,
                         StdioServer& io,
                         size_t worker_threads)
    : proxy_(proxy),
      io_(io),
      worker_threads_(worker_threads == 0 ? 1 : worker_threads) {}

void ProxyServer::writeReplies(const std::vector<nlohmann::json>& replies) {
  for (const auto& reply : replies) {
    io_.writeLine(reply.dump());
  }
}

void ProxyServer::run() {
  WorkerPool pool(worker_threads_);
  HITL_LOG(Info, "Proxy serving on stdio with {} workers", worker_threads_);

  io_.start([this, &pool](std::string line) {
    bool queued = pool.submit([this, line]() {
      auto reply = proxy_.handle(line);
      handled_.fetch_add(1);
      if (reply) {
        io_.writeLine(reply->dump());
      }
    });
    if (!queued) {
      HITL_LOG(Debug, "Dropping client message received during shutdown");
    }
  });

  io_.wait();

  // Queued work either completes or, after stop(), answers Cancelled
  pool.shutdown();
  writeReplies(proxy_.shutdown());
  HITL_LOG(Info, "Proxy stopped after {} messages", handled_.load());
}

void ProxyServer::stop() {
  std::call_once(stop_once_, [this]() {
    HITL_LOG(Info, "Stopping proxy");
    writeReplies(proxy_.shutdown());
    io_.stop();
  });
}

}  // namespace proxy
}  // namespace hitl
