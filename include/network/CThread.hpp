/*-------------------------------------------------------------------------
 *
 * CThread.hpp
 *      Named worker thread used by the I/O event loop.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace DocLink
{

class CThread
{
  public:
    CThread();
    ~CThread();

    CThread(const CThread&) = delete;
    CThread& operator=(const CThread&) = delete;

    bool start(std::function<void()> function, const std::string& name = "");
    bool isRunning() const noexcept;
    void join();
    std::thread::id getId() const noexcept;
    bool isJoinable() const noexcept;
    bool isCurrentThread() const noexcept;

    static size_t getActiveThreadCount();

  private:
    /* Shared with the running thread so it may outlive this object */
    struct State
    {
        std::atomic<bool> running{false};
        std::function<void()> threadFunction;
    };

    std::thread thread_;
    std::shared_ptr<State> state_;
    static std::atomic<size_t> activeThreadCount_;
};

} /* namespace DocLink */
