#pragma once

#include "hitl/logging/logger_registry.h"

// Component must be defined before including this header to get a named
// logger; otherwise everything lands in "default".
#ifndef HITL_LOG_COMPONENT
#define HITL_LOG_COMPONENT "default"
#endif

#ifdef HITL_LOG_DISABLE
#define HITL_LOG(level, ...) ((void)0)
#else
#define HITL_LOG(level, ...)                                           \
  do {                                                                 \
    auto hitl_logger_ =                                                \
        ::hitl::logging::LoggerRegistry::instance().getOrCreateLogger( \
            HITL_LOG_COMPONENT);                                       \
    if (hitl_logger_->shouldLog(::hitl::logging::LogLevel::level)) {   \
      hitl_logger_->log(::hitl::logging::LogLevel::level, __FILE__,    \
                        __LINE__, __FUNCTION__, __VA_ARGS__);          \
    }                                                                  \
  } while (0)
#endif

// Logging scoped to a proxy exchange (request id / tool name)
#define HITL_LOG_WITH_CONTEXT(level, context, ...)                      \
  do {                                                                  \
    auto hitl_logger_ =                                                 \
        ::hitl::logging::LoggerRegistry::instance().getOrCreateLogger(  \
            HITL_LOG_COMPONENT);                                        \
    if (hitl_logger_->shouldLog(::hitl::logging::LogLevel::level)) {    \
      hitl_logger_->logWithContext(::hitl::logging::LogLevel::level,    \
                                   context, __VA_ARGS__);               \
    }                                                                   \
  } while (0)

#define HITL_LOG_DEBUG(...) HITL_LOG(Debug, __VA_ARGS__)
#define HITL_LOG_INFO(...) HITL_LOG(Info, __VA_ARGS__)
#define HITL_LOG_WARNING(...) HITL_LOG(Warning, __VA_ARGS__)
#define HITL_LOG_ERROR(...) HITL_LOG(Error, __VA_ARGS__)

#define COMPONENT_LOG(component, level, ...)                             \
  ::hitl::logging::ComponentLogger(::hitl::logging::Component::component, \
                                   #component)                           \
      .log(::hitl::logging::LogLevel::level, __VA_ARGS__)
