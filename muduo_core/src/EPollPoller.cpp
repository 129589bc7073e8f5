#include "EPollPoller.h"

#include <errno.h>
#include <unistd.h>

#include <system_error>

#include "Channel.h"
#include "LogMacros.h"

namespace {
// Channel::index_ 记录该 Channel 在 epoll 中的注册状态
constexpr int kNew = -1;  // 从未注册（Channel 初始值）
constexpr int kAdded = 1;  // 已在 epoll 中
constexpr int kDeleted = 2;  // 仍在 channels_ 中，但已从 epoll 摘除

const char* OperationName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
    }
    return "?";
}
}  // namespace

EPollPoller::EPollPoller(EventLoop* loop) : Poller(loop), epollfd_(::epoll_create1(EPOLL_CLOEXEC)), events_(kInitEventListSize) {
    if (epollfd_ < 0)
        throw std::system_error(errno, std::generic_category(), "epoll_create1");
}

EPollPoller::~EPollPoller() {
    ::close(epollfd_);
}

Timestamp EPollPoller::poll(int timeoutMs, ChannelList* activeChannels) {
    const int numEvents = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const Timestamp now(Timestamp::now());

    if (numEvents < 0) {
        if (savedErrno != EINTR)
            LOG_ERROR("[EPollPoller] epoll_wait failed errno={}", savedErrno);
        return now;
    }

    fillActiveChannels(numEvents, activeChannels);
    // 事件表被填满说明并发 fd 较多，扩容以减少下一轮的截断
    if (static_cast<std::size_t>(numEvents) == events_.size())
        events_.resize(events_.size() * 2);
    return now;
}

void EPollPoller::updateChannel(Channel* channel) {
    const int state = channel->getIndex();
    const int fd = channel->getFd();

    if (state != kAdded) {
        if (state == kNew)
            channels_[fd] = channel;
        channel->setIndex(kAdded);
        update(EPOLL_CTL_ADD, channel);
        return;
    }

    if (channel->isNoneEvent()) {
        update(EPOLL_CTL_DEL, channel);
        channel->setIndex(kDeleted);
    } else {
        update(EPOLL_CTL_MOD, channel);
    }
}

void EPollPoller::removeChannel(Channel* channel) {
    channels_.erase(channel->getFd());
    if (channel->getIndex() == kAdded)
        update(EPOLL_CTL_DEL, channel);
    channel->setIndex(kNew);
}

void EPollPoller::fillActiveChannels(int numEvents, ChannelList* activeChannels) const {
    for (int i = 0; i < numEvents; ++i) {
        auto* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->setRevents(static_cast<int>(events_[i].events));
        activeChannels->push_back(channel);
    }
}

void EPollPoller::update(int operation, Channel* channel) {
    epoll_event event{};
    event.events = static_cast<uint32_t>(channel->getEvents());
    event.data.ptr = channel;

    const int fd = channel->getFd();
    LOG_TRACE("[EPollPoller] epoll_ctl {} fd={} events={}", OperationName(operation), fd, channel->getEvents());
    if (::epoll_ctl(epollfd_, operation, fd, &event) == 0)
        return;

    // fd 已被对端或 AMQP 库关闭时 DEL 返回 EBADF/ENOENT，属正常收尾
    if (operation == EPOLL_CTL_DEL && (errno == EBADF || errno == ENOENT))
        return;
    LOG_ERROR("[EPollPoller] epoll_ctl {} fd={} failed errno={}", OperationName(operation), fd, errno);
}
