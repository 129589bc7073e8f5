#include "MQConsumer.h"

#include "LogMacros.h"

MQConsumer::MQConsumer(MQClient* client) {
    channel_ = std::make_unique<AMQP::TcpChannel>(client->connection());

    channel_->onError([](const char* msg) { LOG_ERROR("[MQConsumer] Channel error: {}", msg); });
}

void MQConsumer::setPrefetch(std::uint16_t count) {
    channel_->setQos(count);
}

void MQConsumer::consume(const std::string& queue, MessageCallback cb) {
    // 声明队列（幂等），再开始消费
    channel_->declareQueue(queue, AMQP::durable).onSuccess([queue] { LOG_INFO("[MQConsumer] Declared queue: {}", queue); });

    AMQP::TcpChannel* channel = channel_.get();
    channel_->consume(queue)
        .onSuccess([this, queue](const std::string& tag) {
            consumerTag_ = tag;
            LOG_INFO("[MQConsumer] Consuming queue {} (tag={})", queue, tag);
        })
        .onReceived([cb, channel](const AMQP::Message& msg, uint64_t deliveryTag, bool redelivered) {
            std::string body(msg.body(), msg.bodySize());
            if (redelivered)
                LOG_DEBUG("[MQConsumer] Redelivered message tag={}", deliveryTag);
            if (cb(body))
                channel->ack(deliveryTag);
            else
                channel->reject(deliveryTag);
        })
        .onError([queue](const char* msg) { LOG_ERROR("[MQConsumer] Consume on {} failed: {}", queue, msg); });
}

void MQConsumer::cancel() {
    if (consumerTag_.empty())
        return;
    channel_->cancel(consumerTag_);
    LOG_INFO("[MQConsumer] Cancelled consumer {}", consumerTag_);
    consumerTag_.clear();
}
