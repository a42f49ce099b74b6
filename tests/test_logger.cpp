/*-------------------------------------------------------------------------
 *
 * test_logger.cpp
 *      Tests for level filtering and file output of the logger.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

namespace DocLink
{
namespace Test
{

TEST(LoggerTest, ParsesLevelNames)
{
    EXPECT_EQ(CLogger::parseLevel("trace"), CLogLevel::TRACE);
    EXPECT_EQ(CLogger::parseLevel("Debug"), CLogLevel::DEBUG);
    EXPECT_EQ(CLogger::parseLevel("WARNING"), CLogLevel::WARN);
    EXPECT_EQ(CLogger::parseLevel("error"), CLogLevel::ERROR);
    EXPECT_EQ(CLogger::parseLevel("fatal"), CLogLevel::FATAL);
    EXPECT_EQ(CLogger::parseLevel("verbose"), CLogLevel::INFO);
}

TEST(LoggerTest, FiltersBelowConfiguredLevel)
{
    CLogger logger("filter-test");

    EXPECT_EQ(logger.getLogLevel(), CLogLevel::INFO);
    EXPECT_FALSE(logger.isEnabled(CLogLevel::DEBUG));
    EXPECT_TRUE(logger.isEnabled(CLogLevel::INFO));

    logger.setLogLevel(CLogLevel::ERROR);
    EXPECT_FALSE(logger.isEnabled(CLogLevel::WARN));
    EXPECT_TRUE(logger.isEnabled(CLogLevel::FATAL));
}

TEST(LoggerTest, WritesEnabledMessagesToFile)
{
    std::filesystem::path path =
        std::filesystem::temp_directory_path() /
        ("doclink_logger_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    {
        CLogger logger("stream");
        logger.enableConsoleOutput(false);
        logger.enableFileOutput(true);
        logger.setLogFile(path.string());
        ASSERT_FALSE(logger.initialize());

        logger.log(CLogLevel::DEBUG, "hidden message");
        logger.log(CLogLevel::WARN, "read timed out");
        logger.logWithContext(CLogLevel::ERROR, "connect failed", "127.0.0.1");
        logger.shutdown();
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();

    EXPECT_EQ(text.find("hidden message"), std::string::npos);
    EXPECT_NE(text.find("WARN  stream: read timed out"), std::string::npos);
    EXPECT_NE(text.find("ERROR  stream: [127.0.0.1] connect failed"),
              std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, ChildSharesOutputsWithOwnLevel)
{
    std::filesystem::path path =
        std::filesystem::temp_directory_path() /
        ("doclink_logger_child_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    auto parent = std::make_shared<CLogger>("doclink");
    parent->enableConsoleOutput(false);
    parent->enableFileOutput(true);
    parent->setLogFile(path.string());
    parent->setLogLevel(CLogLevel::DEBUG);
    ASSERT_FALSE(parent->initialize());

    std::shared_ptr<CLogger> stream = parent->child("doclink.stream");
    EXPECT_EQ(stream->getComponent(), "doclink.stream");
    EXPECT_EQ(stream->getLogLevel(), CLogLevel::DEBUG);

    stream->setLogLevel(CLogLevel::ERROR);
    EXPECT_TRUE(parent->isEnabled(CLogLevel::DEBUG));

    stream->log(CLogLevel::INFO, "filtered in child");
    stream->log(CLogLevel::ERROR, "from child");
    parent->log(CLogLevel::DEBUG, "from parent");
    parent->shutdown();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();

    EXPECT_EQ(text.find("filtered in child"), std::string::npos);
    EXPECT_NE(text.find("doclink.stream: from child"), std::string::npos);
    EXPECT_NE(text.find("doclink: from parent"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, UnwritableFileFailsInitialization)
{
    CLogger logger;
    logger.enableFileOutput(true);
    logger.setLogFile("/nonexistent-dir/doclink.log");

    EXPECT_EQ(logger.initialize(), std::make_error_code(std::errc::io_error));
}

} /* namespace Test */
} /* namespace DocLink */
