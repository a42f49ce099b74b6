/*-------------------------------------------------------------------------
 *
 * CAsyncStream.hpp
 *      Stream base with inbound reassembly and blocking wrappers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CLogger.hpp"
#include "buffer/CBufferPool.hpp"
#include "buffer/CByteBuffer.hpp"
#include "network/IStream.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace DocLink
{

enum class CStreamState
{
    Unopened,
    Open,
    Closed,
    Failed
};

/**
 * Turns arbitrarily fragmented inbound chunks into exact-length reads.
 * Subclasses provide the connection and push what they receive through
 * onInboundData() and onInboundFailure().
 *
 * The inbound queue and the pending read share one lock; handlers are
 * always invoked with the lock released. Only one read may be outstanding;
 * a second one fails with ReadAlreadyPending. An open issued while another
 * is connecting fails with OpenAlreadyPending. A failure is sticky and is
 * reported to every later read or write.
 */
class CAsyncStream : public IStream,
                     public std::enable_shared_from_this<CAsyncStream>
{
  public:
    ~CAsyncStream() override;

    CByteBuffer getBuffer(size_t size) override;

    std::error_code open() override;
    void openAsync(OpenHandler handler) override;

    std::error_code write(std::vector<CByteBuffer> buffers) override;
    void writeAsync(std::vector<CByteBuffer> buffers,
                    WriteHandler handler) override;

    std::error_code read(size_t numBytes, CCompositeBuffer& result) override;
    void readAsync(size_t numBytes, ReadHandler handler) override;

    const CServerAddress& getAddress() const noexcept override;
    void close() override;
    bool isClosed() const override;

    CStreamState getState() const;
    size_t bufferedBytes() const;
    bool hasPendingRead() const;

  protected:
    CAsyncStream(const CServerAddress& address,
                 std::shared_ptr<CBufferPool> pool,
                 std::shared_ptr<CLogger> logger);

    /* Lower layer; completions may arrive on any thread */
    virtual void doOpen(OpenHandler handler) = 0;
    virtual void doWrite(std::vector<CByteBuffer> buffers,
                         WriteHandler handler) = 0;
    virtual void doClose() noexcept = 0;

    /* Called outside the lock whenever a read starts or stops waiting */
    virtual void onReadPendingChanged();

    void onInboundData(CByteBuffer&& chunk);
    void onInboundFailure(const std::error_code& ec);

    std::shared_ptr<CBufferPool> pool_;
    std::shared_ptr<CLogger> logger_;

  private:
    struct PendingRead
    {
        size_t numBytes;
        ReadHandler handler;
    };

    /* Caller holds mutex_ */
    std::error_code checkUsable() const;
    CCompositeBuffer assemble(size_t numBytes);
    void releaseQueue() noexcept;

    CServerAddress address_;

    mutable std::mutex mutex_;
    CStreamState state_;
    std::error_code terminalError_;
    std::deque<CByteBuffer> inbound_;
    size_t queuedBytes_;
    std::optional<PendingRead> pendingRead_;
    bool opening_;
};

} /* namespace DocLink */
