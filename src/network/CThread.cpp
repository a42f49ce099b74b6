/*-------------------------------------------------------------------------
 *
 * CThread.cpp
 *      Named worker thread used by the I/O event loop.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CThread.hpp"

#include <pthread.h>
#include <system_error>

namespace DocLink
{

std::atomic<size_t> CThread::activeThreadCount_(0);

CThread::CThread() : thread_(), state_(std::make_shared<State>())
{
}

/*
 * ~CThread
 *		Join the thread, or let it finish on its own when the object is
 *		destroyed from the thread itself.
 */
CThread::~CThread()
{
    if (thread_.joinable() && isCurrentThread())
        thread_.detach();
    else
        join();
}

/*
 * start
 *		Launch the thread; returns false if it is already running or the
 *		system refused to create it.
 */
bool CThread::start(std::function<void()> function, const std::string& name)
{
    if (state_->running || thread_.joinable())
        return false;

    state_->threadFunction = std::move(function);
    state_->running = true;
    activeThreadCount_++;
    try
    {
        std::shared_ptr<State> state = state_;
        thread_ = std::thread(
            [state, name]()
            {
                /* Linux limits thread names to 15 characters */
                if (!name.empty())
                    pthread_setname_np(pthread_self(),
                                       name.substr(0, 15).c_str());
                if (state->threadFunction)
                    state->threadFunction();
                state->running = false;
                activeThreadCount_--;
            });
        return true;
    }
    catch (const std::system_error&)
    {
        state_->running = false;
        activeThreadCount_--;
        return false;
    }
}

void CThread::join()
{
    if (thread_.joinable() && !isCurrentThread())
        thread_.join();
}

bool CThread::isRunning() const noexcept
{
    return state_->running;
}

std::thread::id CThread::getId() const noexcept
{
    return thread_.get_id();
}

bool CThread::isJoinable() const noexcept
{
    return thread_.joinable();
}

bool CThread::isCurrentThread() const noexcept
{
    return thread_.get_id() == std::this_thread::get_id();
}

size_t CThread::getActiveThreadCount()
{
    return activeThreadCount_.load();
}

} /* namespace DocLink */
