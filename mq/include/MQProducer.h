#pragma once

#include "MQClient.h"

#include <amqpcpp.h>
#include <amqpcpp/linux_tcp/tcpchannel.h>

#include <memory>
#include <string>


// 异步发布者封装
class MQProducer {
public:
    explicit MQProducer(MQClient* client);

    // 声明 topic 交换机（幂等）；空名称直接忽略
    void declareExchange(const std::string& exchange);

    // exchange 可为 ""（直连到队列），routingKey 为队列名
    // 返回 false 表示连接未就绪或通道拒绝写入，消息被丢弃
    bool publish(const std::string& exchange, const std::string& routingKey, const std::string& message);

private:
    MQClient* client_{nullptr};
    std::unique_ptr<AMQP::TcpChannel> channel_;
};
