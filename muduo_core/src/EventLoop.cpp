#include "EventLoop.h"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>

#include "Channel.h"
#include "LogMacros.h"
#include "Poller.h"
#include "TimerQueue.h"

namespace {
// 防止一个线程创建多个 EventLoop
thread_local EventLoop* t_loopInThisThread = nullptr;

// 定义默认的 Poller IO 复用接口的超时时间
constexpr int kPollTimeMs = 10000;

int createEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL("eventfd error:{}", errno);
    }
    return evtfd;
}
}  // namespace

EventLoop::EventLoop() :
    looping_(false),
    quit_(false),
    threadId_(CurrentThread::tid()),
    poller_(Poller::newDefaultPoller(this)),
    wakeupFd_(createEventfd()),
    wakeupChannel_(new Channel(this, wakeupFd_)),
    callingPendingFunctors_(false) {
    LOG_DEBUG("EventLoop created {} in thread {}", static_cast<void*>(this), threadId_);
    if (t_loopInThisThread) {
        LOG_FATAL("Another EventLoop {} exists in this thread {}", static_cast<void*>(t_loopInThisThread), threadId_);
    } else {
        t_loopInThisThread = this;
    }

    // timerfd 的 Channel 需要 poller_ 已就绪
    timerQueue_ = std::make_unique<TimerQueue>(this);

    // 设置 wakeupfd 的事件类型以及发生事件后的回调操作
    wakeupChannel_->setReadCallback([this](Timestamp) { handleRead(); });
    wakeupChannel_->enableReading();
}

EventLoop::~EventLoop() {
    wakeupChannel_->disableAll();
    wakeupChannel_->remove();
    timerQueue_.reset();
    ::close(wakeupFd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::loop() {
    looping_ = true;
    quit_ = false;

    LOG_DEBUG("EventLoop {} start looping", static_cast<void*>(this));

    while (!quit_) {
        activeChannels_.clear();
        pollReturnTime_ = poller_->poll(kPollTimeMs, &activeChannels_);
        for (Channel* channel : activeChannels_) {
            // Poller 监听哪些 channel 发生事件了，然后上报给 EventLoop，通知 channel 处理相应的事件
            channel->handleEvent(pollReturnTime_);
        }
        // 执行当前 EventLoop 事件循环需要处理的回调操作
        doPendingFunctors();
    }

    LOG_DEBUG("EventLoop {} stop looping", static_cast<void*>(this));
    looping_ = false;
}

// 退出事件循环：1. loop 在自己的线程中调用 quit  2. 在非 loop 的线程中调用 loop 的 quit
void EventLoop::quit() {
    quit_ = true;
    if (!isInLoopThread()) {
        wakeup();
    }
}

void EventLoop::runInLoop(Functor cb) {
    if (isInLoopThread()) {
        cb();
    } else {
        queueInLoop(std::move(cb));
    }
}

void EventLoop::queueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFunctors_.emplace_back(std::move(cb));
    }

    // callingPendingFunctors_ 为 true 表示 loop 正在执行回调，执行完又会阻塞在 poll 上，需要再次唤醒
    if (!isInLoopThread() || callingPendingFunctors_) {
        wakeup();
    }
}

TimerId EventLoop::runAt(Timestamp time, TimerCallback cb) {
    return timerQueue_->addTimer(std::move(cb), time, 0.0);
}

TimerId EventLoop::runAfter(double delaySeconds, TimerCallback cb) {
    return runAt(addTime(Timestamp::now(), delaySeconds), std::move(cb));
}

TimerId EventLoop::runEvery(double intervalSeconds, TimerCallback cb) {
    Timestamp time(addTime(Timestamp::now(), intervalSeconds));
    return timerQueue_->addTimer(std::move(cb), time, intervalSeconds);
}

void EventLoop::cancel(TimerId timerId) {
    timerQueue_->cancel(timerId);
}

void EventLoop::handleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        LOG_ERROR("EventLoop::handleRead() reads {} bytes instead of 8", n);
    }
}

// 向 wakeupFd_ 写一个数据，wakeupChannel 就发生读事件，当前 loop 线程就会被唤醒
void EventLoop::wakeup() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        LOG_ERROR("EventLoop::wakeup() writes {} bytes instead of 8", n);
    }
}

void EventLoop::updateChannel(Channel* channel) {
    poller_->updateChannel(channel);
}

void EventLoop::removeChannel(Channel* channel) {
    poller_->removeChannel(channel);
}

bool EventLoop::hasChannel(Channel* channel) {
    return poller_->hasChannel(channel);
}

void EventLoop::doPendingFunctors() {
    std::vector<Functor> functors;
    callingPendingFunctors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pendingFunctors_);
    }

    for (const Functor& functor : functors) {
        functor();
    }

    callingPendingFunctors_ = false;
}
