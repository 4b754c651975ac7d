#pragma once

#include "canal/logging/logger_registry.h"

// Source files name their logger by defining CANAL_LOG_COMPONENT, e.g.
// "client.http", before including this header.
#ifndef CANAL_LOG_COMPONENT
#define CANAL_LOG_COMPONENT "root"
#endif

#ifdef CANAL_LOG_DISABLE
#define CANAL_LOG_AT(level, connection_id, ...) ((void)0)
#else
// The logger is looked up once per call site
#define CANAL_LOG_AT(level, connection_id, ...)                          \
  do {                                                                   \
    static const ::canal::logging::LoggerSharedPtr canal_site_logger =   \
        ::canal::logging::LoggerRegistry::instance().getOrCreateLogger(  \
            CANAL_LOG_COMPONENT);                                        \
    if (canal_site_logger->shouldLog(::canal::logging::LogLevel::level)) { \
      canal_site_logger->log(::canal::logging::LogLevel::level,          \
                             (connection_id), __FILE__, __LINE__,        \
                             __FUNCTION__, __VA_ARGS__);                 \
    }                                                                    \
  } while (0)
#endif

#define CANAL_LOG(level, ...) CANAL_LOG_AT(level, 0, __VA_ARGS__)

// Tags the line with a client connection id
#define CANAL_CONN_LOG(level, connection_id, ...) \
  CANAL_LOG_AT(level, connection_id, __VA_ARGS__)
