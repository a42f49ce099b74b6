/*-------------------------------------------------------------------------
 *
 * CLogger.hpp
 *      Leveled logger writing to the console and an optional file.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "ILogger.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace DocLink
{

/**
 * Output lines look like
 *   2025-01-31 12:00:00.123 [4242] WARN  doclink.stream: read timed out
 *
 * Loggers made with child() write through the same console and file
 * outputs as their parent but carry their own component name and level.
 */
class CLogger : public ILogger
{
  public:
    explicit CLogger(const std::string& component = "doclink");
    ~CLogger() override;

    void log(CLogLevel level, const std::string& message) override;
    bool isEnabled(CLogLevel level) const noexcept override;
    void setLogLevel(CLogLevel level) override;
    CLogLevel getLogLevel() const noexcept override;
    std::error_code initialize() override;
    void shutdown() noexcept override;

    void logWithContext(CLogLevel level, const std::string& message,
                        const std::string& context);
    std::shared_ptr<CLogger> child(const std::string& component) const;
    const std::string& getComponent() const noexcept;

    void setLogFile(const std::string& filename);
    void enableConsoleOutput(bool enable);
    void enableFileOutput(bool enable);
    void setTimestampFormat(const std::string& format);

    static CLogLevel parseLevel(const std::string& levelName);
    static const char* levelName(CLogLevel level) noexcept;

  private:
    struct Output
    {
        std::mutex mutex;
        bool consoleOutput = true;
        bool fileOutput = false;
        std::string logFile;
        std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
        std::unique_ptr<std::ofstream> fileStream;
    };

    CLogger(const std::string& component, std::shared_ptr<Output> output,
            CLogLevel level);

    /* Caller holds output_->mutex */
    std::string formatMessage(CLogLevel level,
                              const std::string& message) const;
    std::string getTimestamp() const;

    std::string component_;
    std::shared_ptr<Output> output_;
    std::atomic<CLogLevel> logLevel_;
};

} /* namespace DocLink */
