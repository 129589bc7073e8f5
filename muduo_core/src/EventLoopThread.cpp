#include "EventLoopThread.h"

#include "EventLoop.h"

EventLoopThread::EventLoopThread(ThreadInitCallback cb, std::string name) :
    loop_(nullptr), callback_(std::move(cb)), name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() {
    stop();
}

EventLoop* EventLoopThread::startLoop() {
    thread_ = std::thread([this] { threadFunc(); });

    EventLoop* loop = nullptr;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return loop_ != nullptr; });
        loop = loop_;
    }
    return loop;
}

void EventLoopThread::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_ != nullptr) {
            loop_->quit();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

// 下面这个方法是在单独的新线程里面运行的
void EventLoopThread::threadFunc() {
    EventLoop loop;  // 创建一个独立的 eventloop，和上面的线程是一一对应的，one loop per thread

    if (callback_) {
        callback_(&loop);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    loop.loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}
