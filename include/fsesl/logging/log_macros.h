#pragma once

#include "fsesl/logging/logger_registry.h"

#ifdef FSESL_LOG_DISABLE
#define FSESL_LOG(level, ...) ((void)0)
#else
#define FSESL_LOG(level, ...)                                          \
  do {                                                                 \
    auto fsesl_logger_ =                                               \
        ::fsesl::logging::LoggerRegistry::instance().getOrCreateLogger( \
            FSESL_LOG_COMPONENT);                                      \
    if (fsesl_logger_->shouldLog(::fsesl::logging::LogLevel::level)) { \
      fsesl_logger_->log(::fsesl::logging::LogLevel::level, __FILE__,  \
                         __LINE__, __FUNCTION__, __VA_ARGS__);         \
    }                                                                  \
  } while (0)
#endif

// Component must be defined before using FSESL_LOG
#ifndef FSESL_LOG_COMPONENT
#define FSESL_LOG_COMPONENT "default"
#endif

// Log through an explicit logger instance (per-socket sinks)
#define FSESL_LOG_TO(logger, level, ...)                                  \
  do {                                                                    \
    if ((logger) && (logger)->shouldLog(::fsesl::logging::LogLevel::level)) { \
      (logger)->log(::fsesl::logging::LogLevel::level, __FILE__, __LINE__, \
                    __FUNCTION__, __VA_ARGS__);                            \
    }                                                                     \
  } while (0)
