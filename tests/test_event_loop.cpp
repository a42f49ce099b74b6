/*-------------------------------------------------------------------------
 *
 * test_event_loop.cpp
 *      Tests for the epoll event loop: tasks, descriptors and timers.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CEventLoop.hpp"
#include "network/CThread.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace DocLink
{
namespace Test
{

namespace
{
constexpr auto WAIT_LIMIT = std::chrono::seconds(5);
} /* anonymous namespace */

class EventLoopTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        loop = CEventLoop::create();
        ASSERT_FALSE(loop->start());
    }

    void TearDown() override
    {
        loop->stop();
    }

    /* Wait until every task posted so far has run */
    void drain()
    {
        std::promise<void> done;
        std::future<void> future = done.get_future();
        loop->post([&done]() { done.set_value(); });
        ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    }

    std::shared_ptr<CEventLoop> loop;
};

TEST_F(EventLoopTest, PostedTasksRunOnLoopThreadInOrder)
{
    std::promise<bool> onLoop;
    std::future<bool> future = onLoop.get_future();
    std::vector<int> order;

    EXPECT_TRUE(loop->isRunning());
    EXPECT_FALSE(loop->isInLoopThread());

    loop->post([&order]() { order.push_back(1); });
    loop->post([&order]() { order.push_back(2); });
    loop->post([&]() { onLoop.set_value(loop->isInLoopThread()); });

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EventLoopTest, ThrowingTaskDoesNotStopLoop)
{
    loop->post([]() { throw std::runtime_error("task failure"); });
    drain();
    EXPECT_TRUE(loop->isRunning());
}

TEST_F(EventLoopTest, TimerFiresOnceAndUnregisters)
{
    std::promise<void> fired;
    std::future<void> future = fired.get_future();
    std::atomic<int> calls{0};
    std::error_code ec;

    auto started = std::chrono::steady_clock::now();
    CEventLoop::RegistrationId id = loop->armTimer(
        std::chrono::milliseconds(20),
        [&]()
        {
            if (calls++ == 0)
                fired.set_value();
        },
        ec);

    ASSERT_FALSE(ec);
    EXPECT_NE(id, CEventLoop::INVALID_REGISTRATION);
    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - started,
              std::chrono::milliseconds(20));

    drain();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(loop->registrationCount(), 0u);
}

TEST_F(EventLoopTest, DisarmedTimerNeverFires)
{
    std::atomic<bool> fired{false};
    std::error_code ec;

    CEventLoop::RegistrationId id = loop->armTimer(
        std::chrono::milliseconds(50), [&fired]() { fired = true; }, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(loop->registrationCount(), 1u);

    loop->disarmTimer(id);
    EXPECT_EQ(loop->registrationCount(), 0u);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    drain();
    EXPECT_FALSE(fired.load());

    /* unknown ids are ignored */
    loop->disarmTimer(id);
}

TEST_F(EventLoopTest, DescriptorCallbackSeesReadiness)
{
    int fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    ASSERT_GE(fd, 0);

    std::promise<uint32_t> ready;
    std::future<uint32_t> future = ready.get_future();
    std::atomic<bool> reported{false};
    std::error_code ec;

    CEventLoop::RegistrationId id = loop->addFd(
        fd, EPOLLIN,
        [&](uint32_t events)
        {
            uint64_t value;
            while (::read(fd, &value, sizeof(value)) > 0)
            {
            }
            if (!reported.exchange(true))
                ready.set_value(events);
        },
        ec);
    ASSERT_FALSE(ec);

    uint64_t one = 1;
    ASSERT_EQ(::write(fd, &one, sizeof(one)),
              static_cast<ssize_t>(sizeof(one)));

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_TRUE(future.get() & EPOLLIN);

    loop->removeFd(id);
    EXPECT_EQ(loop->registrationCount(), 0u);
    ::close(fd);
}

TEST_F(EventLoopTest, ModifyAndRemoveUnknownRegistration)
{
    EXPECT_EQ(loop->modifyFd(12345, EPOLLIN),
              std::make_error_code(std::errc::bad_file_descriptor));
    loop->removeFd(12345);
    EXPECT_EQ(loop->registrationCount(), 0u);
}

TEST_F(EventLoopTest, AddInvalidDescriptorFails)
{
    std::error_code ec;
    CEventLoop::RegistrationId id =
        loop->addFd(-1, EPOLLIN, [](uint32_t) {}, ec);

    EXPECT_TRUE(ec);
    EXPECT_EQ(id, CEventLoop::INVALID_REGISTRATION);
    EXPECT_EQ(loop->registrationCount(), 0u);
}

TEST(EventLoopLifecycleTest, StopIsIdempotentAndDefaultLoopRuns)
{
    auto loop = CEventLoop::create();
    ASSERT_FALSE(loop->start());
    EXPECT_FALSE(loop->start());
    loop->stop();
    loop->stop();
    EXPECT_FALSE(loop->isRunning());

    auto shared = CEventLoop::defaultLoop();
    EXPECT_EQ(shared, CEventLoop::defaultLoop());
    EXPECT_TRUE(shared->isRunning());
}

TEST(ThreadTest, RunsFunctionAndJoins)
{
    CThread thread;
    std::promise<std::thread::id> inside;
    std::future<std::thread::id> future = inside.get_future();

    ASSERT_TRUE(thread.start(
        [&inside]() { inside.set_value(std::this_thread::get_id()); },
        "doclink-test"));
    EXPECT_FALSE(thread.isCurrentThread());
    EXPECT_FALSE(thread.start([]() {}));

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_EQ(future.get(), thread.getId());
    thread.join();
    EXPECT_FALSE(thread.isRunning());
    EXPECT_FALSE(thread.isJoinable());
}

} /* namespace Test */
} /* namespace DocLink */
