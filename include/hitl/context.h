#ifndef HITL_CONTEXT_H
#define HITL_CONTEXT_H

#include <memory>

#include "hitl/config/config.h"
#include "hitl/core/clock.h"
#include "hitl/http/http_client.h"

namespace hitl {

/**
 * @brief Process-wide collaborators passed explicitly to each component
 */
struct Context {
  config::Config config;
  std::shared_ptr<http::HttpTransport> http;
  Clock clock;

  TimePoint now() const { return clock(); }

  // Wires a CurlHttpClient configured from config.retry / timeouts
  static Context create(const config::Config& config);
};

// Installs the log level and, if configured, the rotating log file
void configureLogging(const config::Config& config);

}  // namespace hitl

#endif  // HITL_CONTEXT_H
