/*-------------------------------------------------------------------------
 *
 * CLogger.cpp
 *		  Logging system implementation for DocLink
 *
 * Provides leveled logging to the console and an optional log file with
 * configurable timestamp formatting.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogger.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace DocLink
{

CLogger::CLogger(const std::string& component)
    : CLogger(component, std::make_shared<Output>(), CLogLevel::INFO)
{
}

CLogger::CLogger(const std::string& component, std::shared_ptr<Output> output,
                 CLogLevel level)
    : component_(component), output_(std::move(output)), logLevel_(level)
{
}

CLogger::~CLogger() = default;

/*
 * log
 *		Format the message and write it to every enabled output
 */
void CLogger::log(CLogLevel level, const std::string& message)
{
    if (!isEnabled(level))
        return;

    std::lock_guard<std::mutex> lock(output_->mutex);
    std::string line = formatMessage(level, message);

    if (output_->consoleOutput)
        std::cerr << line << std::endl;
    if (output_->fileOutput && output_->fileStream &&
        output_->fileStream->is_open())
    {
        *output_->fileStream << line << '\n';
        output_->fileStream->flush();
    }
}

bool CLogger::isEnabled(CLogLevel level) const noexcept
{
    return level >= logLevel_.load();
}

void CLogger::setLogLevel(CLogLevel level)
{
    logLevel_ = level;
}

CLogLevel CLogger::getLogLevel() const noexcept
{
    return logLevel_;
}

/*
 * initialize
 *		Open the log file in append mode when file output is enabled.
 *		Children share the file, so only one of them needs to call this.
 */
std::error_code CLogger::initialize()
{
    std::lock_guard<std::mutex> lock(output_->mutex);

    if (!output_->fileOutput || output_->logFile.empty())
        return std::error_code();
    if (output_->fileStream && output_->fileStream->is_open())
        return std::error_code();

    auto stream =
        std::make_unique<std::ofstream>(output_->logFile, std::ios::app);
    if (!stream->is_open())
    {
        std::cerr << "cannot open log file '" << output_->logFile << "'"
                  << std::endl;
        return std::make_error_code(std::errc::io_error);
    }
    output_->fileStream = std::move(stream);
    return std::error_code();
}

void CLogger::shutdown() noexcept
{
    std::lock_guard<std::mutex> lock(output_->mutex);
    if (output_->fileStream)
        output_->fileStream->close();
    output_->fileStream.reset();
}

void CLogger::logWithContext(CLogLevel level, const std::string& message,
                             const std::string& context)
{
    if (isEnabled(level))
        log(level, "[" + context + "] " + message);
}

/*
 * child
 *		Logger for a sub-component; starts at this logger's current level
 */
std::shared_ptr<CLogger> CLogger::child(const std::string& component) const
{
    return std::shared_ptr<CLogger>(
        new CLogger(component, output_, logLevel_.load()));
}

const std::string& CLogger::getComponent() const noexcept
{
    return component_;
}

void CLogger::setLogFile(const std::string& filename)
{
    std::lock_guard<std::mutex> lock(output_->mutex);
    output_->logFile = filename;
}

void CLogger::enableConsoleOutput(bool enable)
{
    std::lock_guard<std::mutex> lock(output_->mutex);
    output_->consoleOutput = enable;
}

void CLogger::enableFileOutput(bool enable)
{
    std::lock_guard<std::mutex> lock(output_->mutex);
    output_->fileOutput = enable;
}

void CLogger::setTimestampFormat(const std::string& format)
{
    std::lock_guard<std::mutex> lock(output_->mutex);
    output_->timestampFormat = format;
}

/*
 * parseLevel
 *		Map a level name from configuration onto CLogLevel, INFO if unknown
 */
CLogLevel CLogger::parseLevel(const std::string& levelName)
{
    std::string upper = levelName;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "TRACE")
        return CLogLevel::TRACE;
    if (upper == "DEBUG")
        return CLogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING")
        return CLogLevel::WARN;
    if (upper == "ERROR")
        return CLogLevel::ERROR;
    if (upper == "FATAL")
        return CLogLevel::FATAL;
    return CLogLevel::INFO;
}

const char* CLogger::levelName(CLogLevel level) noexcept
{
    switch (level)
    {
    case CLogLevel::TRACE:
        return "TRACE";
    case CLogLevel::DEBUG:
        return "DEBUG";
    case CLogLevel::INFO:
        return "INFO";
    case CLogLevel::WARN:
        return "WARN";
    case CLogLevel::ERROR:
        return "ERROR";
    case CLogLevel::FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}

std::string CLogger::formatMessage(CLogLevel level,
                                   const std::string& message) const
{
    std::ostringstream line;

    line << getTimestamp() << " [" << static_cast<int>(getpid()) << "] "
         << levelName(level) << "  " << component_ << ": " << message;
    return line.str();
}

/*
 * getTimestamp
 *		Local time in the configured format, with milliseconds appended
 */
std::string CLogger::getTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
    std::tm local{};
    std::ostringstream stamp;

    localtime_r(&seconds, &local);
    stamp << std::put_time(&local, output_->timestampFormat.c_str()) << '.'
          << std::setfill('0') << std::setw(3) << millis.count();
    return stamp.str();
}

} /* namespace DocLink */
