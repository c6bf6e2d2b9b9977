#pragma once

#include "conduit/logging/logger_registry.h"

// Component must be defined before including this header to get a
// dedicated logger; otherwise records go to "default".
#ifndef CONDUIT_LOG_COMPONENT
#define CONDUIT_LOG_COMPONENT "default"
#endif

#ifdef CONDUIT_LOG_DISABLE
#define CONDUIT_LOG(level, ...) ((void)0)
#define CONDUIT_LOG_WITH_CONTEXT(level, context, ...) ((void)0)
#else
#define CONDUIT_LOG(level, ...)                                           \
  do {                                                                    \
    if (::conduit::logging::LoggerRegistry::instance().shouldLog(         \
            CONDUIT_LOG_COMPONENT, ::conduit::logging::LogLevel::level)) { \
      ::conduit::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(CONDUIT_LOG_COMPONENT)                       \
          ->log(::conduit::logging::LogLevel::level, __FILE__, __LINE__,  \
                __FUNCTION__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)

#define CONDUIT_LOG_WITH_CONTEXT(level, context, ...)                     \
  do {                                                                    \
    auto conduit_logger_ =                                                \
        ::conduit::logging::LoggerRegistry::instance().getOrCreateLogger( \
            CONDUIT_LOG_COMPONENT);                                       \
    if (conduit_logger_->shouldLog(::conduit::logging::LogLevel::level)) { \
      ::conduit::logging::LogContext conduit_ctx_ = (context);            \
      conduit_ctx_.setLocation(__FILE__, __LINE__, __FUNCTION__);         \
      conduit_logger_->logWithContext(::conduit::logging::LogLevel::level, \
                                      conduit_ctx_, __VA_ARGS__);         \
    }                                                                     \
  } while (0)
#endif

#define COMPONENT_LOG(component, level, ...)                                \
  ::conduit::logging::ComponentLogger(                                      \
      ::conduit::logging::Component::component, #component)                 \
      .log(::conduit::logging::LogLevel::level, __VA_ARGS__)
