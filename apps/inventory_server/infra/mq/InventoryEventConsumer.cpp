#include "infra/mq/InventoryEventConsumer.h"

#include <utility>

#include "LogMacros.h"
#include "MQConsumer.h"

// ========== 构造函数 ==========

InventoryEventConsumer::InventoryEventConsumer(Dependencies deps) : InventoryEventConsumer(std::move(deps), Options{}) {}

InventoryEventConsumer::InventoryEventConsumer(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 生命周期管理 ==========

void InventoryEventConsumer::Start(RawHandler handler) {
    if (running_)
        return;
    if (!deps_.mq) {
        LOG_ERROR("[InventoryEventConsumer] Missing MQConsumer dependency");
        return;
    }
    handler_ = std::move(handler);
    running_ = true;

    deps_.mq->setPrefetch(options_.prefetch);
    deps_.mq->consume(options_.queueName, [this](const std::string& payload) { return handleMessage(payload); });

    LOG_INFO("[InventoryEventConsumer] Started consuming queue: {}", options_.queueName);
}

void InventoryEventConsumer::Stop() {
    if (!running_)
        return;
    running_ = false;
    if (deps_.mq)
        deps_.mq->cancel();
    handler_ = nullptr;
    LOG_INFO("[InventoryEventConsumer] Stopped consuming queue: {}", options_.queueName);
}

// ========== 消息分发 ==========

bool InventoryEventConsumer::handleMessage(const std::string& payload) {
    if (!running_ || !handler_)
        return false;
    try {
        handler_(payload);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("[InventoryEventConsumer] Handler exception: {}", e.what());
        return false;
    }
}
