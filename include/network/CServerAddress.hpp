/*-------------------------------------------------------------------------
 *
 * CServerAddress.hpp
 *      Host and port of a document database server.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <string>

namespace DocLink
{

class CServerAddress
{
  public:
    static constexpr uint16_t DEFAULT_PORT = 27017;
    static constexpr const char* DEFAULT_HOST = "127.0.0.1";

    CServerAddress();
    explicit CServerAddress(const std::string& host,
                            uint16_t port = DEFAULT_PORT);

    /* Accepts "host", "host:port" and "[v6-address]:port" */
    static CServerAddress parse(const std::string& address);

    const std::string& getHost() const noexcept;
    uint16_t getPort() const noexcept;
    std::string toString() const;

    bool operator==(const CServerAddress& other) const = default;

  private:
    std::string host_;
    uint16_t port_;
};

} /* namespace DocLink */
