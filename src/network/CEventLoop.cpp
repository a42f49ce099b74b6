/*-------------------------------------------------------------------------
 *
 * CEventLoop.cpp
 *      Single-threaded epoll event loop for socket readiness and timers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CEventLoop.hpp"

#include "CLogMacros.hpp"

#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace DocLink
{

namespace
{
std::error_code lastError() noexcept
{
    return std::error_code(errno, std::generic_category());
}
} /* anonymous namespace */

std::shared_ptr<CEventLoop>
CEventLoop::create(std::shared_ptr<CLogger> logger)
{
    if (!logger)
        logger = std::make_shared<CLogger>("eventloop");
    return std::shared_ptr<CEventLoop>(new CEventLoop(std::move(logger)));
}

std::shared_ptr<CEventLoop> CEventLoop::defaultLoop()
{
    static const std::shared_ptr<CEventLoop> loop = []()
    {
        std::shared_ptr<CEventLoop> created = create();
        std::error_code ec = created->start();
        if (ec)
            throw std::system_error(ec, "failed to start the default loop");
        return created;
    }();
    return loop;
}

CEventLoop::CEventLoop(std::shared_ptr<CLogger> logger)
    : logger_(std::move(logger)), epollFd_(-1), wakeupFd_(-1), thread_(),
      running_(false), mutex_(), registrations_(), nextId_(1), tasks_()
{
}

CEventLoop::~CEventLoop()
{
    stop();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : registrations_)
    {
        if (entry.second.ownsFd)
            ::close(entry.second.fd);
    }
    registrations_.clear();
    if (wakeupFd_ >= 0)
        ::close(wakeupFd_);
    if (epollFd_ >= 0)
        ::close(epollFd_);
}

std::error_code CEventLoop::initialize()
{
    if (epollFd_ >= 0)
        return std::error_code{};

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0)
    {
        std::error_code ec = lastError();
        error_log("epoll_create1 failed: " + ec.message());
        return ec;
    }

    wakeupFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeupFd_ < 0)
    {
        std::error_code ec = lastError();
        error_log("eventfd failed: " + ec.message());
        ::close(epollFd_);
        epollFd_ = -1;
        return ec;
    }

    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.u64 = WAKEUP_ID;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeupFd_, &event) < 0)
    {
        std::error_code ec = lastError();
        error_log("failed to register the wakeup descriptor: " + ec.message());
        ::close(wakeupFd_);
        ::close(epollFd_);
        wakeupFd_ = -1;
        epollFd_ = -1;
        return ec;
    }
    return std::error_code{};
}

std::error_code CEventLoop::start()
{
    if (running_)
        return std::error_code{};

    std::error_code ec = initialize();
    if (ec)
        return ec;

    running_ = true;
    if (!thread_.start([this]() { run(); }, "doclink-io"))
    {
        running_ = false;
        error_log("failed to start the event loop thread");
        return std::make_error_code(std::errc::resource_unavailable_try_again);
    }
    /* tasks posted before start */
    wakeup();
    debug_log("event loop started");
    return std::error_code{};
}

void CEventLoop::stop()
{
    if (!running_.exchange(false))
        return;

    wakeup();
    thread_.join();
    debug_log("event loop stopped");
}

bool CEventLoop::isRunning() const noexcept
{
    return running_;
}

bool CEventLoop::isInLoopThread() const noexcept
{
    return thread_.isCurrentThread();
}

void CEventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    wakeup();
}

CEventLoop::RegistrationId CEventLoop::addFd(int fd, uint32_t events,
                                             IoCallback callback,
                                             std::error_code& ec)
{
    std::lock_guard<std::mutex> lock(mutex_);
    RegistrationId id = nextId_++;

    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = events;
    event.data.u64 = id;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &event) < 0)
    {
        ec = lastError();
        return INVALID_REGISTRATION;
    }

    registrations_.emplace(id, Registration{fd, false, std::move(callback)});
    ec.clear();
    return id;
}

std::error_code CEventLoop::modifyFd(RegistrationId id, uint32_t events)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(id);
    if (it == registrations_.end())
        return std::make_error_code(std::errc::bad_file_descriptor);

    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = events;
    event.data.u64 = id;
    if (epoll_ctl(epollFd_, EPOLL_CTL_MOD, it->second.fd, &event) < 0)
        return lastError();
    return std::error_code{};
}

void CEventLoop::removeFd(RegistrationId id) noexcept
{
    unregister(id);
}

/*
 * armTimer
 *		Each timer gets its own timerfd, registered like any descriptor
 */
CEventLoop::RegistrationId CEventLoop::armTimer(std::chrono::milliseconds delay,
                                                Task callback,
                                                std::error_code& ec)
{
    int timerFd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd < 0)
    {
        ec = lastError();
        return INVALID_REGISTRATION;
    }

    struct itimerspec spec;
    std::memset(&spec, 0, sizeof(spec));
    auto count = delay.count() > 0 ? delay.count() : 0;
    spec.it_value.tv_sec = static_cast<time_t>(count / 1000);
    spec.it_value.tv_nsec = static_cast<long>((count % 1000) * 1000000);
    /* an all-zero value would disarm the timer */
    if (count == 0)
        spec.it_value.tv_nsec = 1;

    if (timerfd_settime(timerFd, 0, &spec, nullptr) < 0)
    {
        ec = lastError();
        ::close(timerFd);
        return INVALID_REGISTRATION;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    RegistrationId id = nextId_++;

    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.u64 = id;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, timerFd, &event) < 0)
    {
        ec = lastError();
        ::close(timerFd);
        return INVALID_REGISTRATION;
    }

    registrations_.emplace(
        id, Registration{timerFd, true,
                         [task = std::move(callback)](uint32_t) { task(); }});
    ec.clear();
    return id;
}

void CEventLoop::disarmTimer(RegistrationId id) noexcept
{
    unregister(id);
}

size_t CEventLoop::registrationCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

void CEventLoop::run()
{
    struct epoll_event events[MAX_EVENTS];

    while (running_)
    {
        int count = epoll_wait(epollFd_, events, MAX_EVENTS, -1);
        if (count < 0)
        {
            if (errno == EINTR)
                continue;
            error_log("epoll_wait failed: " + lastError().message());
            break;
        }

        for (int i = 0; i < count && running_; i++)
        {
            if (events[i].data.u64 == WAKEUP_ID)
            {
                uint64_t value;
                while (::read(wakeupFd_, &value, sizeof(value)) > 0)
                {
                }
                drainTasks();
            }
            else
            {
                dispatch(events[i].data.u64, events[i].events);
            }
        }
    }

    /* tasks posted after stop are dropped */
    std::vector<Task> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(tasks_);
    }
}

void CEventLoop::wakeup() noexcept
{
    if (wakeupFd_ < 0)
        return;

    uint64_t one = 1;
    ssize_t written = ::write(wakeupFd_, &one, sizeof(one));
    if (written < 0 && errno != EAGAIN)
        error_log("failed to wake the event loop: " + lastError().message());
}

void CEventLoop::drainTasks()
{
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    for (auto& task : batch)
    {
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            error_log(std::string("exception in posted task: ") + e.what());
        }
    }
}

/*
 * dispatch
 *		Run the callback for a ready registration. Events for registrations
 *		removed earlier in the same batch are ignored.
 */
void CEventLoop::dispatch(RegistrationId id, uint32_t events)
{
    IoCallback callback;
    bool isTimer = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registrations_.find(id);
        if (it == registrations_.end())
            return;
        callback = it->second.callback;
        isTimer = it->second.ownsFd;
    }

    if (isTimer)
        unregister(id);

    try
    {
        callback(events);
    }
    catch (const std::exception& e)
    {
        error_log(std::string("exception in I/O callback: ") + e.what());
    }
}

void CEventLoop::unregister(RegistrationId id) noexcept
{
    IoCallback released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registrations_.find(id);
        if (it == registrations_.end())
            return;

        if (epoll_ctl(epollFd_, EPOLL_CTL_DEL, it->second.fd, nullptr) < 0)
            debug_log("epoll_ctl(DEL) failed for registration " +
                      std::to_string(id) + ": " + lastError().message());
        if (it->second.ownsFd)
            ::close(it->second.fd);
        released = std::move(it->second.callback);
        registrations_.erase(it);
    }
}

} /* namespace DocLink */
