#include "MQClient.h"

#include <stdexcept>

MQClient::MQClient(EventLoop* loop, const std::string& url) : loop_(loop) {
    if (!loop_)
        throw std::invalid_argument("MQClient requires a valid EventLoop");

    AMQP::Address address(url);  // URL 非法时抛出 std::runtime_error
    handler_ = std::make_unique<MQHandler>(loop_);
    connection_ = std::make_unique<AMQP::TcpConnection>(handler_.get(), address);
    LOG_INFO("[MQClient] Connecting to {}:{} vhost={}", address.hostname(), address.port(), address.vhost());
}

MQClient::~MQClient() {
    if (!handler_ || !connection_)
        return;

    // 连接与 Channel 只能在 loop 线程关闭和销毁，所有权移交给任务
    std::shared_ptr<MQHandler> handler(std::move(handler_));
    std::shared_ptr<AMQP::TcpConnection> conn(std::move(connection_));
    loop_->runInLoop([handler, conn]() {
        conn->close();
        handler->unregister();
    });
}
