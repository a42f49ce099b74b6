/*-------------------------------------------------------------------------
 *
 * CAsyncStream.cpp
 *      Stream base with inbound reassembly and blocking wrappers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CAsyncStream.hpp"

#include "CErrors.hpp"
#include "CLogMacros.hpp"

#include <future>
#include <utility>

namespace DocLink
{

CAsyncStream::CAsyncStream(const CServerAddress& address,
                           std::shared_ptr<CBufferPool> pool,
                           std::shared_ptr<CLogger> logger)
    : pool_(std::move(pool)), logger_(std::move(logger)), address_(address),
      mutex_(), state_(CStreamState::Unopened), terminalError_(), inbound_(),
      queuedBytes_(0), pendingRead_(), opening_(false)
{
    if (!pool_)
        pool_ = CBufferPool::create();
}

CAsyncStream::~CAsyncStream()
{
    std::lock_guard<std::mutex> lock(mutex_);
    releaseQueue();
}

CByteBuffer CAsyncStream::getBuffer(size_t size)
{
    return pool_->getBuffer(size);
}

/*-------------------------------------------------------------------------
 * Blocking wrappers: issue the async call and wait for its one result.
 * The handler is the only owner of the promise, so a handler dropped
 * without being called (close() during the wait) breaks it, which is
 * reported as InterruptedWait.
 *-------------------------------------------------------------------------*/

std::error_code CAsyncStream::open()
{
    auto promise = std::make_shared<std::promise<std::error_code>>();
    std::future<std::error_code> future = promise->get_future();

    openAsync([promise = std::move(promise)](const std::error_code& ec)
              { promise->set_value(ec); });
    try
    {
        return future.get();
    }
    catch (const std::future_error&)
    {
        return make_error_code(CDocLinkErrc::InterruptedWait);
    }
}

std::error_code CAsyncStream::write(std::vector<CByteBuffer> buffers)
{
    auto promise = std::make_shared<std::promise<std::error_code>>();
    std::future<std::error_code> future = promise->get_future();

    writeAsync(std::move(buffers),
               [promise = std::move(promise)](const std::error_code& ec)
               { promise->set_value(ec); });
    try
    {
        return future.get();
    }
    catch (const std::future_error&)
    {
        return make_error_code(CDocLinkErrc::InterruptedWait);
    }
}

std::error_code CAsyncStream::read(size_t numBytes, CCompositeBuffer& result)
{
    using Outcome = std::pair<std::error_code, CCompositeBuffer>;
    auto promise = std::make_shared<std::promise<Outcome>>();
    std::future<Outcome> future = promise->get_future();

    readAsync(numBytes,
              [promise = std::move(promise)](const std::error_code& ec,
                                             CCompositeBuffer buffer)
              { promise->set_value(Outcome(ec, std::move(buffer))); });
    try
    {
        Outcome outcome = future.get();
        if (!outcome.first)
            result = std::move(outcome.second);
        return outcome.first;
    }
    catch (const std::future_error&)
    {
        return make_error_code(CDocLinkErrc::InterruptedWait);
    }
}

/*-------------------------------------------------------------------------
 * Completion-based operations
 *-------------------------------------------------------------------------*/

void CAsyncStream::openAsync(OpenHandler handler)
{
    std::error_code ec;
    bool done = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CStreamState::Closed)
            ec = make_error_code(CDocLinkErrc::ClosedTransportUse);
        else if (state_ == CStreamState::Failed)
            ec = terminalError_;
        else if (state_ == CStreamState::Unopened && opening_)
            ec = make_error_code(CDocLinkErrc::OpenAlreadyPending);
        else if (state_ == CStreamState::Unopened)
            done = false;

        if (!done)
            opening_ = true;
    }
    if (done)
    {
        if (ec == CDocLinkErrc::OpenAlreadyPending)
            warn_log("open issued on " + address_.toString() +
                     " while another open is in progress");
        handler(ec);
        return;
    }

    debug_log("opening stream to " + address_.toString());
    doOpen(
        [this, handler = std::move(handler)](const std::error_code& result)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                opening_ = false;
                if (state_ == CStreamState::Closed)
                    return;
                if (result)
                {
                    state_ = CStreamState::Failed;
                    terminalError_ = result;
                    releaseQueue();
                }
                else if (state_ == CStreamState::Unopened)
                {
                    state_ = CStreamState::Open;
                }
            }

            if (result)
                error_log("failed to open stream to " + address_.toString() +
                          ": " + result.message());
            else
                info_log("opened stream to " + address_.toString());
            handler(result);
        });
}

void CAsyncStream::writeAsync(std::vector<CByteBuffer> buffers,
                              WriteHandler handler)
{
    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ec = checkUsable();
        if (!ec && state_ == CStreamState::Unopened)
            ec = make_error_code(CDocLinkErrc::ClosedTransportUse);
    }
    if (ec)
    {
        for (auto& buffer : buffers)
            buffer.release();
        handler(ec);
        return;
    }

    doWrite(std::move(buffers),
            [this, handler = std::move(handler)](const std::error_code& result)
            {
                if (isClosed())
                    return;
                handler(result);
            });
}

/*
 * readAsync
 *		Complete at once from buffered data, or park the request until
 *		enough bytes have arrived.
 */
void CAsyncStream::readAsync(size_t numBytes, ReadHandler handler)
{
    std::error_code ec;
    CCompositeBuffer result;
    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ec = checkUsable();
        if (!ec && pendingRead_)
            ec = make_error_code(CDocLinkErrc::ReadAlreadyPending);
        if (!ec)
        {
            if (queuedBytes_ >= numBytes)
            {
                result = assemble(numBytes);
                complete = true;
            }
            else
            {
                pendingRead_.emplace(PendingRead{numBytes, std::move(handler)});
            }
        }
    }

    if (ec)
    {
        if (ec == CDocLinkErrc::ReadAlreadyPending)
            warn_log("read issued on " + address_.toString() +
                     " while another read is pending");
        handler(ec, CCompositeBuffer());
        return;
    }
    if (complete)
    {
        handler(std::error_code(), std::move(result));
        return;
    }
    onReadPendingChanged();
}

const CServerAddress& CAsyncStream::getAddress() const noexcept
{
    return address_;
}

/*
 * close
 *		Drop the pending read without calling it and hand every queued
 *		buffer back; idempotent.
 */
void CAsyncStream::close()
{
    std::optional<PendingRead> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CStreamState::Closed)
            return;
        state_ = CStreamState::Closed;
        dropped = std::move(pendingRead_);
        pendingRead_.reset();
        releaseQueue();
    }

    doClose();
    dropped.reset();
    info_log("closed stream to " + address_.toString());
}

bool CAsyncStream::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CStreamState::Closed;
}

CStreamState CAsyncStream::getState() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t CAsyncStream::bufferedBytes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queuedBytes_;
}

/*-------------------------------------------------------------------------
 * Lower layer entry points
 *-------------------------------------------------------------------------*/

void CAsyncStream::onReadPendingChanged()
{
}

void CAsyncStream::onInboundData(CByteBuffer&& chunk)
{
    ReadHandler handler;
    CCompositeBuffer result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CStreamState::Closed || state_ == CStreamState::Failed)
        {
            chunk.release();
            return;
        }
        if (chunk.empty())
            return;

        queuedBytes_ += chunk.size();
        inbound_.push_back(std::move(chunk));

        if (!pendingRead_ || queuedBytes_ < pendingRead_->numBytes)
            return;

        result = assemble(pendingRead_->numBytes);
        handler = std::move(pendingRead_->handler);
        pendingRead_.reset();
    }

    onReadPendingChanged();
    handler(std::error_code(), std::move(result));
}

/*
 * onInboundFailure
 *		Enter the failed state; the first error wins and is replayed to
 *		every later read and write.
 */
void CAsyncStream::onInboundFailure(const std::error_code& ec)
{
    std::optional<PendingRead> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CStreamState::Closed || state_ == CStreamState::Failed)
            return;
        state_ = CStreamState::Failed;
        terminalError_ = ec;
        pending = std::move(pendingRead_);
        pendingRead_.reset();
        releaseQueue();
    }

    warn_log("stream to " + address_.toString() + " failed: " + ec.message());
    if (pending)
    {
        onReadPendingChanged();
        pending->handler(ec, CCompositeBuffer());
    }
}

bool CAsyncStream::hasPendingRead() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingRead_.has_value();
}

std::error_code CAsyncStream::checkUsable() const
{
    if (state_ == CStreamState::Closed)
        return make_error_code(CDocLinkErrc::ClosedTransportUse);
    if (state_ == CStreamState::Failed)
        return terminalError_;
    return std::error_code();
}

/*
 * assemble
 *		Take exactly numBytes from the head of the queue. Whole chunks are
 *		moved; the last one is split and its remainder stays at the head.
 */
CCompositeBuffer CAsyncStream::assemble(size_t numBytes)
{
    CCompositeBuffer result;

    while (result.size() < numBytes)
    {
        CByteBuffer& head = inbound_.front();
        size_t needed = numBytes - result.size();

        if (head.size() <= needed)
        {
            queuedBytes_ -= head.size();
            result.addComponent(std::move(head));
            inbound_.pop_front();
        }
        else
        {
            queuedBytes_ -= needed;
            result.addComponent(head.split(needed));
        }
    }
    return result;
}

void CAsyncStream::releaseQueue() noexcept
{
    for (auto& buffer : inbound_)
        buffer.release();
    inbound_.clear();
    queuedBytes_ = 0;
}

} /* namespace DocLink */
