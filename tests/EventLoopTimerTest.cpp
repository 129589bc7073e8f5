#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "EventLoop.h"
#include "EventLoopThread.h"

using namespace std::chrono_literals;

TEST(EventLoopTimerTest, RunAfterFiresOnce) {
    EventLoop loop;
    int fired = 0;
    loop.runAfter(0.01, [&] { ++fired; });
    loop.runAfter(0.05, [&] { loop.quit(); });
    loop.loop();
    EXPECT_EQ(fired, 1);
}

TEST(EventLoopTimerTest, RunEveryRepeatsUntilCancelled) {
    EventLoop loop;
    int ticks = 0;
    TimerId id;
    id = loop.runEvery(0.01, [&] {
        if (++ticks == 3)
            loop.cancel(id);
    });
    loop.runAfter(0.1, [&] { loop.quit(); });
    loop.loop();
    EXPECT_TRUE(id.valid());
    EXPECT_EQ(ticks, 3);
}

TEST(EventLoopTimerTest, CancelBeforeExpiryPreventsCallback) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.runAfter(0.02, [&] { fired = true; });
    loop.cancel(id);
    loop.runAfter(0.05, [&] { loop.quit(); });
    loop.loop();
    EXPECT_FALSE(fired);
}

TEST(EventLoopThreadTest, RunInLoopExecutesOnLoopThread) {
    EventLoopThread thread(EventLoopThread::ThreadInitCallback(), "test-loop");
    EventLoop* loop = thread.startLoop();
    ASSERT_NE(loop, nullptr);
    EXPECT_FALSE(loop->isInLoopThread());

    std::promise<bool> inLoop;
    loop->runInLoop([&] { inLoop.set_value(loop->isInLoopThread()); });
    auto result = inLoop.get_future();
    ASSERT_EQ(result.wait_for(1s), std::future_status::ready);
    EXPECT_TRUE(result.get());

    std::atomic<int> ticks{0};
    auto timer = loop->runEvery(0.01, [&] { ++ticks; });
    std::this_thread::sleep_for(80ms);
    loop->cancel(timer);
    thread.stop();
    EXPECT_GE(ticks.load(), 2);
}
