#pragma once

#include "deepresearch/logging/logger_registry.h"

// Zero-configuration logging through the default logger
#define LOG(level, ...)                                                 \
  do {                                                                  \
    auto logger__ = ::deepresearch::logging::LoggerRegistry::instance() \
                        .getDefaultLogger();                            \
    if (logger__->shouldLog(::deepresearch::logging::LogLevel::level)) { \
      logger__->log(::deepresearch::logging::LogLevel::level, __FILE__, \
                    __LINE__, __FUNCTION__, __VA_ARGS__);               \
    }                                                                   \
  } while (0)

#define LOG_WARNING(...) LOG(Warning, __VA_ARGS__)
#define LOG_ERROR(...) LOG(Error, __VA_ARGS__)

// Component-scoped logging; define DEEPRESEARCH_LOG_COMPONENT before use
#ifdef DEEPRESEARCH_LOG_DISABLE
#define DEEPRESEARCH_LOG(level, ...) ((void)0)
#else
#define DEEPRESEARCH_LOG(level, ...)                                        \
  do {                                                                      \
    if (::deepresearch::logging::LoggerRegistry::instance().shouldLog(      \
            DEEPRESEARCH_LOG_COMPONENT,                                     \
            ::deepresearch::logging::LogLevel::level)) {                    \
      ::deepresearch::logging::LoggerRegistry::instance()                   \
          .getOrCreateLogger(DEEPRESEARCH_LOG_COMPONENT)                    \
          ->log(::deepresearch::logging::LogLevel::level, __FILE__,         \
                __LINE__, __FUNCTION__, __VA_ARGS__);                       \
    }                                                                       \
  } while (0)
#endif

#ifndef DEEPRESEARCH_LOG_COMPONENT
#define DEEPRESEARCH_LOG_COMPONENT "default"
#endif
