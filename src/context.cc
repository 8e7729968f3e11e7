#include "hitl/context.h"

#include "hitl/logging/log_sink.h"
#include "hitl/logging/logger_registry.h"

namespace hitl {

Context Context::create(const config::Config& config) {
  http::CurlHttpClient::Config http_config;
  http_config.connection_timeout = config.connect_timeout;
  http_config.retry.max_retries = config.retry.max_retries;
  http_config.retry.initial_delay = config.retry.initial_delay;
  http_config.retry.max_delay = config.retry.max_delay;
  http_config.retry.backoff_multiplier = config.retry.backoff_multiplier;
  http_config.retry.jitter = config.retry.jitter;

  Context context;
  context.config = config;
  context.http = std::make_shared<http::CurlHttpClient>(http_config);
  context.clock = systemClock();
  return context;
}

void configureLogging(const config::Config& config) {
  auto& registry = logging::LoggerRegistry::instance();
  registry.setGlobalLevel(config.log_level);
  if (config.log_file.empty() &&
      config.log_format == logging::LogFormat::Text) {
    return;
  }

  std::shared_ptr<logging::LogSink> sink;
  if (!config.log_file.empty()) {
    logging::RotatingFileSink::Config sink_config;
    sink_config.base_filename = config.log_file;
    sink = std::make_shared<logging::RotatingFileSink>(sink_config);
  } else {
    sink = std::make_shared<logging::StdioSink>(logging::StdioSink::Stderr);
  }
  if (config.log_format == logging::LogFormat::Json) {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setSink(std::move(sink));
}

}  // namespace hitl
