#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "NonCopyable.h"

class EventLoop;

// one loop per thread：在独立线程中创建并运行 EventLoop
class EventLoopThread : NonCopyable {
public:
    using ThreadInitCallback = std::function<void(EventLoop*)>;

    explicit EventLoopThread(ThreadInitCallback cb = ThreadInitCallback(), std::string name = std::string());
    ~EventLoopThread();

    // 启动线程并阻塞到 loop 创建完成
    EventLoop* startLoop();
    // 退出 loop 并 join 线程（幂等）
    void stop();

private:
    void threadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    ThreadInitCallback callback_;
    std::string name_;
};
