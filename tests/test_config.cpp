/*-------------------------------------------------------------------------
 *
 * test_config.cpp
 *      Tests for configuration loading and client settings.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CClientConfig.hpp"
#include "CConfig.hpp"
#include "CLogger.hpp"
#include "network/CStreamFactory.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace DocLink
{
namespace Test
{

namespace
{

const char* CLIENT_JSON = R"({
    "server": { "host": "DB1.example.com", "port": 27020 },
    "socket": { "readTimeoutMS": 500, "keepAlive": false,
                "receiveBufferSize": 65536 },
    "ssl": { "enabled": true, "caFile": "/etc/doclink/ca.pem" },
    "log": { "level": "debug" },
    "tags": [ "primary", "east" ]
})";

const char* CLIENT_YAML = R"(
server:
  host: "10.0.0.5"
  port: 27018
socket:
  connectTimeoutMS: 2500
  readTimeoutMS: 250
  keepAlive: no
ssl:
  enabled: false
  invalidHostNameAllowed: true
log:
  level: warn
)";

/* Writes content to a uniquely named file removed on destruction */
class TempFile
{
  public:
    TempFile(const std::string& extension, const std::string& content)
    {
        path_ = std::filesystem::temp_directory_path() /
                ("doclink_config_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter_++) + extension);
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const
    {
        return path_.string();
    }

  private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

} /* anonymous namespace */

TEST(ConfigTest, FlattensJsonIntoDottedKeys)
{
    CConfig config;
    ASSERT_FALSE(config.loadFromJson(CLIENT_JSON));

    EXPECT_EQ(config.getString("server.host"), "DB1.example.com");
    EXPECT_EQ(config.getInt("server.port"), 27020);
    EXPECT_EQ(config.getBool("socket.keepAlive"), false);
    EXPECT_TRUE(config.has("ssl.caFile"));
    EXPECT_FALSE(config.has("server"));
    EXPECT_FALSE(config.getInt("missing.key").has_value());

    auto tags = config.get("tags");
    ASSERT_TRUE(tags.has_value());
    EXPECT_EQ(std::get<std::vector<std::string>>(*tags),
              (std::vector<std::string>{"primary", "east"}));
}

TEST(ConfigTest, YamlScalarsAreTyped)
{
    CConfig config;
    ASSERT_FALSE(config.loadFromYaml(CLIENT_YAML));

    /* quoted scalars stay strings */
    auto host = config.get("server.host");
    ASSERT_TRUE(host.has_value());
    EXPECT_TRUE(std::holds_alternative<std::string>(*host));

    auto port = config.get("server.port");
    ASSERT_TRUE(port.has_value());
    EXPECT_TRUE(std::holds_alternative<int64_t>(*port));

    EXPECT_EQ(config.getBool("ssl.enabled"), false);
    EXPECT_EQ(config.getBool("socket.keepAlive"), false);
    EXPECT_EQ(config.getString("log.level"), "warn");
}

TEST(ConfigTest, RejectsMalformedAndNonObjectDocuments)
{
    CConfig config;

    EXPECT_EQ(config.loadFromJson("{ \"server\": "),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(config.loadFromJson("[1, 2]"),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(config.loadFromJson(""),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(config.loadFromYaml("- a\n- b\n"),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_TRUE(config.keys().empty());
}

TEST(ConfigTest, TypedLookupsConvertCompatibleValues)
{
    CConfig config;
    config.set("a", std::string("42"));
    config.set("b", std::string("on"));
    config.set("c", true);
    config.set("d", int64_t{7});
    config.set("e", std::string("not a number"));

    EXPECT_EQ(config.getInt("a"), 42);
    EXPECT_EQ(config.getBool("b"), true);
    EXPECT_EQ(config.getString("c"), "true");
    EXPECT_EQ(config.getString("d"), "7");
    EXPECT_FALSE(config.getInt("e").has_value());
    EXPECT_FALSE(config.getBool("d").has_value());
    EXPECT_EQ(config.keys(), (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(ConfigTest, SerializesBackToJsonAndYaml)
{
    CConfig config;
    config.set("server.host", std::string("localhost"));
    config.set("server.port", int64_t{27017});

    CConfig reloaded;
    ASSERT_FALSE(reloaded.loadFromJson(config.toJson()));
    EXPECT_EQ(reloaded.getString("server.host"), "localhost");
    EXPECT_EQ(reloaded.getInt("server.port"), 27017);

    std::string yaml = config.toYaml();
    EXPECT_NE(yaml.find("server.host: localhost"), std::string::npos);
}

TEST(ConfigTest, LoadsFilesByExtension)
{
    TempFile json(".json", CLIENT_JSON);
    TempFile yaml(".yml", CLIENT_YAML);
    TempFile other(".ini", "[server]\n");

    CConfig fromJson;
    CConfig fromYaml;
    CConfig fromOther;
    EXPECT_FALSE(fromJson.loadFromFile(json.path()));
    EXPECT_FALSE(fromYaml.loadFromFile(yaml.path()));
    EXPECT_EQ(fromOther.loadFromFile(other.path()),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(fromOther.loadFromFile("/nonexistent/doclink.json"),
              std::make_error_code(std::errc::no_such_file_or_directory));

    EXPECT_EQ(fromJson.getInt("server.port"), 27020);
    EXPECT_EQ(fromYaml.getInt("server.port"), 27018);
}

TEST(ClientConfigTest, DefaultsAndValidation)
{
    CClientConfig config;

    EXPECT_EQ(config.getAddress().toString(), "127.0.0.1:27017");
    EXPECT_EQ(config.socket.connectTimeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.socket.readTimeout, std::chrono::milliseconds(0));
    EXPECT_TRUE(config.socket.keepAlive);
    EXPECT_FALSE(config.ssl.enabled);
    EXPECT_TRUE(config.validate());

    config.socket.sendBufferSize = -1;
    EXPECT_FALSE(config.validate());
    config.setDefaults();
    EXPECT_TRUE(config.validate());
}

TEST(ClientConfigTest, LoadsSettingsFromJson)
{
    CConfig raw;
    ASSERT_FALSE(raw.loadFromJson(CLIENT_JSON));

    CClientConfig config;
    ASSERT_FALSE(config.loadFromConfig(raw));

    EXPECT_EQ(config.getAddress(), CServerAddress("db1.example.com", 27020));
    EXPECT_EQ(config.socket.readTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(config.socket.connectTimeout, std::chrono::milliseconds(10000));
    EXPECT_FALSE(config.socket.keepAlive);
    EXPECT_EQ(config.socket.receiveBufferSize, 65536);
    EXPECT_TRUE(config.ssl.enabled);
    EXPECT_EQ(config.ssl.caFile, "/etc/doclink/ca.pem");
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(ClientConfigTest, LoadsSettingsFromYamlFile)
{
    TempFile yaml(".yaml", CLIENT_YAML);

    CClientConfig config;
    ASSERT_FALSE(config.loadFromFile(yaml.path()));

    EXPECT_EQ(config.host, "10.0.0.5");
    EXPECT_EQ(config.port, 27018);
    EXPECT_EQ(config.socket.connectTimeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.socket.readTimeout, std::chrono::milliseconds(250));
    EXPECT_FALSE(config.socket.keepAlive);
    EXPECT_FALSE(config.ssl.enabled);
    EXPECT_TRUE(config.ssl.invalidHostNameAllowed);
}

TEST(ClientConfigTest, RejectsOutOfRangeValues)
{
    CConfig raw;
    raw.set("server.port", int64_t{70000});

    CClientConfig config;
    EXPECT_EQ(config.loadFromConfig(raw),
              std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(config.port, CServerAddress::DEFAULT_PORT);

    CConfig negative;
    negative.set("socket.readTimeoutMS", int64_t{-5});
    EXPECT_EQ(config.loadFromConfig(negative),
              std::make_error_code(std::errc::invalid_argument));
}

TEST(ClientConfigTest, FactoryTakesSettingsAndLogLevel)
{
    CConfig raw;
    ASSERT_FALSE(raw.loadFromJson(CLIENT_JSON));
    CClientConfig config;
    ASSERT_FALSE(config.loadFromConfig(raw));

    auto logger = std::make_shared<CLogger>("factory-test");
    CStreamFactory factory = CStreamFactory::fromConfig(config, logger);

    EXPECT_EQ(logger->getLogLevel(), CLogLevel::DEBUG);
    EXPECT_EQ(factory.getSettings().readTimeout,
              std::chrono::milliseconds(500));
    EXPECT_TRUE(factory.getSslSettings().enabled);
    EXPECT_NE(factory.getBufferPool(), nullptr);

    std::shared_ptr<IStream> stream =
        factory.create(config.getAddress());
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->getAddress(), config.getAddress());
    stream->close();
}

} /* namespace Test */
} /* namespace DocLink */
