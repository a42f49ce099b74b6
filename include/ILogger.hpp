/*-------------------------------------------------------------------------
 *
 * ILogger.hpp
 *      Logging interface and severity levels.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <string>
#include <system_error>

namespace DocLink
{

enum class CLogLevel
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/**
 * Sink for the log macros. isEnabled() lets callers skip building a
 * message that would be filtered out.
 */
class ILogger
{
  public:
    virtual ~ILogger() = default;

    virtual void log(CLogLevel level, const std::string& message) = 0;
    virtual bool isEnabled(CLogLevel level) const noexcept = 0;
    virtual void setLogLevel(CLogLevel level) = 0;
    virtual CLogLevel getLogLevel() const noexcept = 0;
    virtual std::error_code initialize() = 0;
    virtual void shutdown() noexcept = 0;
};

} /* namespace DocLink */
