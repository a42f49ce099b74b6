/*-------------------------------------------------------------------------
 *
 * CClientConfig.hpp
 *      Connection settings for a DocLink client.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CConfig.hpp"
#include "network/CServerAddress.hpp"
#include "network/CStreamSettings.hpp"

#include <cstdint>
#include <string>
#include <system_error>

namespace DocLink
{

struct CClientConfig
{
    std::string host;
    uint16_t port;
    CStreamSettings socket;
    CSslSettings ssl;
    std::string logLevel;

    CClientConfig()
        : host(CServerAddress::DEFAULT_HOST),
          port(CServerAddress::DEFAULT_PORT), socket(), ssl(), logLevel("INFO")
    {
    }

    void setDefaults();
    bool validate() const;

    /* Keys absent from config keep their current value */
    std::error_code loadFromConfig(const CConfig& config);
    std::error_code loadFromFile(const std::string& filename);

    CServerAddress getAddress() const;
};

} /* namespace DocLink */
