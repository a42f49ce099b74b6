/*-------------------------------------------------------------------------
 *
 * CServerAddress.cpp
 *      Host and port of a document database server.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CServerAddress.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace DocLink
{

CServerAddress::CServerAddress() : host_(DEFAULT_HOST), port_(DEFAULT_PORT)
{
}

CServerAddress::CServerAddress(const std::string& host, uint16_t port)
    : host_(host), port_(port)
{
    std::transform(host_.begin(), host_.end(), host_.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (host_.empty())
        host_ = DEFAULT_HOST;
}

CServerAddress CServerAddress::parse(const std::string& address)
{
    std::string host = address;
    std::string portText;

    if (!address.empty() && address.front() == '[')
    {
        size_t close = address.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("unterminated IPv6 address: " +
                                        address);
        host = address.substr(1, close - 1);
        if (close + 1 < address.size())
        {
            if (address[close + 1] != ':')
                throw std::invalid_argument("bad server address: " + address);
            portText = address.substr(close + 2);
        }
    }
    else
    {
        size_t colon = address.rfind(':');
        if (colon != std::string::npos)
        {
            host = address.substr(0, colon);
            portText = address.substr(colon + 1);
        }
    }

    if (portText.empty())
        return CServerAddress(host);

    size_t consumed = 0;
    int port = std::stoi(portText, &consumed);
    if (consumed != portText.size() || port <= 0 || port > 65535)
        throw std::invalid_argument("bad port in server address: " + address);
    return CServerAddress(host, static_cast<uint16_t>(port));
}

const std::string& CServerAddress::getHost() const noexcept
{
    return host_;
}

uint16_t CServerAddress::getPort() const noexcept
{
    return port_;
}

std::string CServerAddress::toString() const
{
    if (host_.find(':') != std::string::npos)
        return "[" + host_ + "]:" + std::to_string(port_);
    return host_ + ":" + std::to_string(port_);
}

} /* namespace DocLink */
