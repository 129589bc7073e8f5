#include "MQProducer.h"

#include "LogMacros.h"

MQProducer::MQProducer(MQClient* client) : client_(client) {
    channel_ = std::make_unique<AMQP::TcpChannel>(client->connection());

    channel_->onError([](const char* msg) { LOG_ERROR("[MQProducer] Channel error: {}", msg); });
}

void MQProducer::declareExchange(const std::string& exchange) {
    if (exchange.empty())
        return;
    channel_->declareExchange(exchange, AMQP::topic, AMQP::durable)
        .onSuccess([exchange] { LOG_INFO("[MQProducer] Declared exchange: {}", exchange); })
        .onError([exchange](const char* msg) { LOG_ERROR("[MQProducer] Declare exchange {} failed: {}", exchange, msg); });
}

bool MQProducer::publish(const std::string& exchange, const std::string& routingKey, const std::string& message) {
    if (!client_->ready() || !channel_->usable()) {
        LOG_WARN("[MQProducer] Connection not ready, dropping message to [{}] key=[{}]", exchange, routingKey);
        return false;
    }
    // 若 exchange 为空，则按直连到队列的语义（默认交换机）
    if (!channel_->publish(exchange, routingKey, message)) {
        LOG_WARN("[MQProducer] Publish to [{}] key=[{}] rejected by channel", exchange, routingKey);
        return false;
    }
    LOG_DEBUG("[MQProducer] Published to [{}] key=[{}] size={}", exchange, routingKey, message.size());
    return true;
}
