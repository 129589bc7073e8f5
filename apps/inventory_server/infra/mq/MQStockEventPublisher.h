#pragma once

#include <string>
#include <string_view>

#include "domain/InventoryPorts.h"

class EventLoop;
class MQProducer;

/**
 * @brief MQStockEventPublisher：库存事件的 RabbitMQ 发布实现
 *
 * AMQP 通道只能在连接所在的 loop 线程中使用，发布动作通过 runInLoop 投递。
 * 发送即忘：连接未就绪时丢弃并记录日志。
 */
class MQStockEventPublisher : public StockEventPublisher {
public:
    struct Dependencies {
        MQProducer* producer{nullptr};
        EventLoop* loop{nullptr};
    };

    struct Options {
        std::string exchange{"inventory.exchange"};
        std::string lowStockRoutingKey{"inventory.low_stock"};
        std::string stockChangedRoutingKey{"inventory.stock_changed"};
    };

    MQStockEventPublisher(Dependencies deps, Options options);

    void PublishLowStock(const InventoryLedger& ledger, Clock::time_point occurredAt) override;
    void PublishStockChanged(const InventoryLedger& ledger, std::string_view operation, Clock::time_point occurredAt) override;

    static std::string BuildLowStockPayload(const InventoryLedger& ledger, Clock::time_point occurredAt);
    static std::string BuildStockChangedPayload(const InventoryLedger& ledger, std::string_view operation, Clock::time_point occurredAt);

private:
    void publish(const std::string& routingKey, std::string payload);

    Dependencies deps_;
    Options options_;
};

// ISO-8601 UTC，毫秒精度
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
