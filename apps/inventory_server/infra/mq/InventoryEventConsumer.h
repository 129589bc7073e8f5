#pragma once

#include <cstdint>
#include <functional>
#include <string>

class MQConsumer;

/**
 * @brief InventoryEventConsumer：库存命令队列的消费器封装
 *
 * 提供 Start/Stop 生命周期管理，并将消息分发给上层回调。
 */
class InventoryEventConsumer {
public:
    struct Dependencies {
        MQConsumer* mq{nullptr};
    };

    struct Options {
        std::string queueName{"inventory.commands"};
        std::uint16_t prefetch{32};
    };

    using RawHandler = std::function<void(const std::string& payload)>;

    InventoryEventConsumer(Dependencies deps);
    InventoryEventConsumer(Dependencies deps, Options options);

    void Start(RawHandler handler);
    void Stop();

    bool IsRunning() const noexcept { return running_; }
    const Options& options() const noexcept { return options_; }

private:
    bool handleMessage(const std::string& payload);

private:
    Dependencies deps_;
    Options options_;
    RawHandler handler_;
    bool running_{false};
};
