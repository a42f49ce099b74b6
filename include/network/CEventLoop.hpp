/*-------------------------------------------------------------------------
 *
 * CEventLoop.hpp
 *      Single-threaded epoll event loop for socket readiness and timers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CLogger.hpp"
#include "network/CThread.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace DocLink
{

/**
 * Owns one I/O thread. All registered callbacks and posted tasks run on that
 * thread, one at a time. Registration calls may come from any thread.
 *
 * Callbacks must not block: a blocking stream call made from the loop
 * thread waits for work only the loop thread can do.
 */
class CEventLoop : public std::enable_shared_from_this<CEventLoop>
{
  public:
    using Task = std::function<void()>;
    using IoCallback = std::function<void(uint32_t events)>;
    using RegistrationId = uint64_t;

    static constexpr RegistrationId INVALID_REGISTRATION = 0;

    static std::shared_ptr<CEventLoop>
    create(std::shared_ptr<CLogger> logger = nullptr);

    /* Process-wide loop, started on first use */
    static std::shared_ptr<CEventLoop> defaultLoop();

    ~CEventLoop();

    CEventLoop(const CEventLoop&) = delete;
    CEventLoop& operator=(const CEventLoop&) = delete;

    std::error_code start();
    void stop();
    bool isRunning() const noexcept;
    bool isInLoopThread() const noexcept;

    void post(Task task);

    /* events is an EPOLLIN/EPOLLOUT mask; the fd stays owned by the caller */
    RegistrationId addFd(int fd, uint32_t events, IoCallback callback,
                         std::error_code& ec);
    std::error_code modifyFd(RegistrationId id, uint32_t events);
    void removeFd(RegistrationId id) noexcept;

    /* One-shot timer; the callback runs on the loop thread */
    RegistrationId armTimer(std::chrono::milliseconds delay, Task callback,
                            std::error_code& ec);
    void disarmTimer(RegistrationId id) noexcept;

    size_t registrationCount() const;

  private:
    struct Registration
    {
        int fd;
        bool ownsFd; /* timers own their timerfd */
        IoCallback callback;
    };

    explicit CEventLoop(std::shared_ptr<CLogger> logger);

    std::error_code initialize();
    void run();
    void wakeup() noexcept;
    void drainTasks();
    void dispatch(RegistrationId id, uint32_t events);
    void unregister(RegistrationId id) noexcept;

    static constexpr RegistrationId WAKEUP_ID = ~static_cast<RegistrationId>(0);
    static constexpr int MAX_EVENTS = 64;

    std::shared_ptr<CLogger> logger_;
    int epollFd_;
    int wakeupFd_;
    CThread thread_;
    std::atomic<bool> running_;

    mutable std::mutex mutex_;
    std::unordered_map<RegistrationId, Registration> registrations_;
    RegistrationId nextId_;
    std::vector<Task> tasks_;
};

} /* namespace DocLink */
