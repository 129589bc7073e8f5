#include "Poller.h"

#include "Channel.h"
#include "EPollPoller.h"

bool Poller::hasChannel(Channel* channel) const {
    auto it = channels_.find(channel->getFd());
    return it != channels_.end() && it->second == channel;
}

Poller* Poller::newDefaultPoller(EventLoop* loop) {
    return new EPollPoller(loop);
}
