/*-------------------------------------------------------------------------
 *
 * CTcpStream.hpp
 *      TCP stream, optionally wrapped in TLS, driven by the event loop.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "buffer/CByteBuffer.hpp"
#include "network/CAsyncStream.hpp"
#include "network/CEventLoop.hpp"
#include "network/CStreamSettings.hpp"

#include <openssl/ssl.h>

#include <cstdint>
#include <deque>
#include <memory>
#include <netdb.h>
#include <vector>

namespace DocLink
{

/**
 * All socket and TLS work happens on the event loop thread. close() may be
 * called from any thread; the descriptor is torn down on the loop.
 */
class CTcpStream : public CAsyncStream
{
  public:
    static constexpr size_t READ_CHUNK_SIZE = 16 * 1024;
    /* A fresh read buffer is taken when less than this is left */
    static constexpr size_t MIN_READ_SPACE = 512;

    static std::shared_ptr<CTcpStream>
    create(const CServerAddress& address, const CStreamSettings& settings,
           const CSslSettings& sslSettings, std::shared_ptr<CEventLoop> loop,
           std::shared_ptr<CBufferPool> pool, std::shared_ptr<CLogger> logger);

    ~CTcpStream() override;

  protected:
    void doOpen(OpenHandler handler) override;
    void doWrite(std::vector<CByteBuffer> buffers,
                 WriteHandler handler) override;
    void doClose() noexcept override;
    void onReadPendingChanged() override;

  private:
    enum class Phase
    {
        Idle,
        Connecting,
        Handshaking,
        Established,
        TornDown
    };

    struct PendingWrite
    {
        std::vector<uint8_t> data;
        size_t offset;
        WriteHandler handler;
    };

    CTcpStream(const CServerAddress& address, const CStreamSettings& settings,
               const CSslSettings& sslSettings,
               std::shared_ptr<CEventLoop> loop,
               std::shared_ptr<CBufferPool> pool,
               std::shared_ptr<CLogger> logger);

    std::weak_ptr<CTcpStream> weakSelf();

    /* Loop thread only */
    void startConnect();
    void connectNext();
    void finishConnect();
    void onConnectTimeout(uint64_t attempt);
    std::error_code applySocketOptions(int fd);
    void startTls();
    void continueHandshake();
    void establish();
    void failOpen(const std::error_code& ec, const std::string& reason);
    void handleEvents(uint32_t events);
    void handleReadable();
    void flushWrites();
    void failStream(const std::error_code& ec, const std::string& reason);
    void updateInterest(uint32_t events);
    void updateIdleTimer(bool restart);
    void onIdleTimeout(uint64_t generation);
    void cancelConnectTimer() noexcept;
    void closeSocket() noexcept;
    void teardown() noexcept;
    std::string sslErrorString() const;

    CStreamSettings settings_;
    CSslSettings sslSettings_;
    std::shared_ptr<CEventLoop> loop_;

    Phase phase_;
    int fd_;
    CEventLoop::RegistrationId registration_;
    struct addrinfo* addresses_;
    struct addrinfo* nextAddress_;
    uint64_t connectAttempt_;
    CEventLoop::RegistrationId connectTimer_;
    OpenHandler openHandler_;

    SSL_CTX* sslContext_;
    SSL* ssl_;

    std::deque<PendingWrite> writeQueue_;

    CEventLoop::RegistrationId idleTimer_;
    uint64_t idleGeneration_;

    CByteBuffer readBuffer_;
};

} /* namespace DocLink */
