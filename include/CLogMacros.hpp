/*-------------------------------------------------------------------------
 *
 * CLogMacros.hpp
 *      Logging macros for classes holding a logger_ member.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CLogger.hpp"

/* Skips formatting when there is no logger or the level is filtered */
#define elog(loglevel, ...)                                                    \
    do                                                                         \
    {                                                                          \
        if (logger_ && logger_->isEnabled(loglevel))                           \
        {                                                                      \
            logger_->log(loglevel, __VA_ARGS__);                               \
        }                                                                      \
    } while (0)

/* Convenience macros for common log levels */
#define trace_log(...) elog(CLogLevel::TRACE, __VA_ARGS__)
#define debug_log(...) elog(CLogLevel::DEBUG, __VA_ARGS__)
#define error_log(...) elog(CLogLevel::ERROR, __VA_ARGS__)
#define info_log(...) elog(CLogLevel::INFO, __VA_ARGS__)
#define warn_log(...) elog(CLogLevel::WARN, __VA_ARGS__)
#define fatal_log(...) elog(CLogLevel::FATAL, __VA_ARGS__)
