/*-------------------------------------------------------------------------
 *
 * CStreamSettings.hpp
 *      Socket and TLS settings for transport streams.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <chrono>
#include <string>

namespace DocLink
{

struct CStreamSettings
{
    std::chrono::milliseconds connectTimeout{10000};
    /* Idle read timeout; zero disables it */
    std::chrono::milliseconds readTimeout{0};
    bool keepAlive = true;
    /* Zero keeps the operating system default */
    int sendBufferSize = 0;
    int receiveBufferSize = 0;
};

struct CSslSettings
{
    bool enabled = false;
    bool invalidHostNameAllowed = false;
    /* Empty uses the default verify paths */
    std::string caFile;
};

} /* namespace DocLink */
