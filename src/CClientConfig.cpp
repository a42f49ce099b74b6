/*-------------------------------------------------------------------------
 *
 * CClientConfig.cpp
 *      Connection settings for a DocLink client.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CClientConfig.hpp"

#include <chrono>
#include <optional>

namespace DocLink
{

/*
 * setDefaults
 *		Reset every setting to its default value
 */
void CClientConfig::setDefaults()
{
    host = CServerAddress::DEFAULT_HOST;
    port = CServerAddress::DEFAULT_PORT;
    socket = CStreamSettings();
    ssl = CSslSettings();
    logLevel = "INFO";
}

/*
 * validate
 *		Check ranges of the loaded values
 */
bool CClientConfig::validate() const
{
    if (host.empty())
        return false;
    if (port == 0)
        return false;
    if (socket.connectTimeout.count() < 0 || socket.readTimeout.count() < 0)
        return false;
    if (socket.sendBufferSize < 0 || socket.receiveBufferSize < 0)
        return false;
    return true;
}

std::error_code CClientConfig::loadFromConfig(const CConfig& config)
{
    if (std::optional<std::string> value = config.getString("server.host"))
        host = *value;
    if (std::optional<int64_t> value = config.getInt("server.port"))
    {
        if (*value <= 0 || *value > 65535)
            return std::make_error_code(std::errc::invalid_argument);
        port = static_cast<uint16_t>(*value);
    }

    if (std::optional<int64_t> value = config.getInt("socket.connectTimeoutMS"))
        socket.connectTimeout = std::chrono::milliseconds(*value);
    if (std::optional<int64_t> value = config.getInt("socket.readTimeoutMS"))
        socket.readTimeout = std::chrono::milliseconds(*value);
    if (std::optional<bool> value = config.getBool("socket.keepAlive"))
        socket.keepAlive = *value;
    if (std::optional<int64_t> value = config.getInt("socket.sendBufferSize"))
        socket.sendBufferSize = static_cast<int>(*value);
    if (std::optional<int64_t> value =
            config.getInt("socket.receiveBufferSize"))
        socket.receiveBufferSize = static_cast<int>(*value);

    if (std::optional<bool> value = config.getBool("ssl.enabled"))
        ssl.enabled = *value;
    if (std::optional<bool> value =
            config.getBool("ssl.invalidHostNameAllowed"))
        ssl.invalidHostNameAllowed = *value;
    if (std::optional<std::string> value = config.getString("ssl.caFile"))
        ssl.caFile = *value;

    if (std::optional<std::string> value = config.getString("log.level"))
        logLevel = *value;

    if (!validate())
        return std::make_error_code(std::errc::invalid_argument);
    return std::error_code{};
}

std::error_code CClientConfig::loadFromFile(const std::string& filename)
{
    CConfig config;

    std::error_code ec = config.loadFromFile(filename);
    if (ec)
        return ec;
    return loadFromConfig(config);
}

CServerAddress CClientConfig::getAddress() const
{
    return CServerAddress(host, port);
}

} /* namespace DocLink */
