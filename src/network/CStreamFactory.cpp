/*-------------------------------------------------------------------------
 *
 * CStreamFactory.cpp
 *      Creates configured TCP streams that share a loop and a buffer pool.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CStreamFactory.hpp"

#include "CLogMacros.hpp"
#include "network/CTcpStream.hpp"

namespace DocLink
{

CStreamFactory::CStreamFactory(const CStreamSettings& settings,
                               const CSslSettings& sslSettings,
                               std::shared_ptr<CEventLoop> loop,
                               std::shared_ptr<CBufferPool> pool,
                               std::shared_ptr<CLogger> logger)
    : settings_(settings), sslSettings_(sslSettings), loop_(std::move(loop)),
      pool_(std::move(pool)), logger_(std::move(logger))
{
    if (!loop_)
        loop_ = CEventLoop::defaultLoop();
    if (!pool_)
        pool_ = CBufferPool::create();
}

CStreamFactory CStreamFactory::fromConfig(const CClientConfig& config,
                                          std::shared_ptr<CLogger> logger)
{
    if (logger)
        logger->setLogLevel(CLogger::parseLevel(config.logLevel));
    return CStreamFactory(config.socket, config.ssl, nullptr, nullptr,
                          std::move(logger));
}

std::shared_ptr<IStream>
CStreamFactory::create(const CServerAddress& address) const
{
    debug_log("creating " + std::string(sslSettings_.enabled ? "TLS" : "TCP") +
              " stream to " + address.toString());
    std::shared_ptr<CLogger> streamLogger;
    if (logger_)
        streamLogger = logger_->child(logger_->getComponent() + ".stream");
    return CTcpStream::create(address, settings_, sslSettings_, loop_, pool_,
                              std::move(streamLogger));
}

const CStreamSettings& CStreamFactory::getSettings() const noexcept
{
    return settings_;
}

const CSslSettings& CStreamFactory::getSslSettings() const noexcept
{
    return sslSettings_;
}

std::shared_ptr<CBufferPool> CStreamFactory::getBufferPool() const
{
    return pool_;
}

} /* namespace DocLink */
