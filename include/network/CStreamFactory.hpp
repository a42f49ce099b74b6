/*-------------------------------------------------------------------------
 *
 * CStreamFactory.hpp
 *      Creates configured TCP streams that share a loop and a buffer pool.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CClientConfig.hpp"
#include "CLogger.hpp"
#include "buffer/CBufferPool.hpp"
#include "network/CEventLoop.hpp"
#include "network/CServerAddress.hpp"
#include "network/CStreamSettings.hpp"
#include "network/IStream.hpp"

#include <memory>

namespace DocLink
{

class CStreamFactory
{
  public:
    /* A null loop selects the process-wide default loop */
    CStreamFactory(const CStreamSettings& settings,
                   const CSslSettings& sslSettings,
                   std::shared_ptr<CEventLoop> loop = nullptr,
                   std::shared_ptr<CBufferPool> pool = nullptr,
                   std::shared_ptr<CLogger> logger = nullptr);

    static CStreamFactory fromConfig(const CClientConfig& config,
                                     std::shared_ptr<CLogger> logger = nullptr);

    std::shared_ptr<IStream> create(const CServerAddress& address) const;

    const CStreamSettings& getSettings() const noexcept;
    const CSslSettings& getSslSettings() const noexcept;
    std::shared_ptr<CBufferPool> getBufferPool() const;

  private:
    CStreamSettings settings_;
    CSslSettings sslSettings_;
    std::shared_ptr<CEventLoop> loop_;
    std::shared_ptr<CBufferPool> pool_;
    std::shared_ptr<CLogger> logger_;
};

} /* namespace DocLink */
