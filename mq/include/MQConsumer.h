#pragma once

#include "MQClient.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <amqpcpp.h>
#include <amqpcpp/linux_tcp/tcpchannel.h>


// 异步消费者封装
class MQConsumer {
public:
    // 返回 false 表示处理失败，消息将被 reject（不重新入队）
    using MessageCallback = std::function<bool(const std::string&)>;

    explicit MQConsumer(MQClient* client);

    // 预取数量，0 表示不限制
    void setPrefetch(std::uint16_t count);

    // 订阅队列：收到消息后回调 cb(body)，处理完成后手动 ack
    void consume(const std::string& queue, MessageCallback cb);

    // 取消当前订阅；消息回调不再触发
    void cancel();

private:
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::string consumerTag_;
};
