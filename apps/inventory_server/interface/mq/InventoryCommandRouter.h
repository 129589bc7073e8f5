#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

class InventoryEventConsumer;
class InventoryDomainService;
class MQProducer;

/**
 * @brief InventoryCommandRouter：库存命令路由器
 *
 * interface 层组件，消费 inventory.commands 队列中的 JSON 命令，调用领域服务，
 * 并把 {requestId, ok, error?, code?, ...} 应答发布到 replyTo（默认 inventory.replies）。
 * 支持的命令：reserve / confirm / release / adjust / check。
 */
class InventoryCommandRouter {
public:
    struct Dependencies {
        InventoryEventConsumer* consumer{nullptr};
        InventoryDomainService* inventory{nullptr};
        MQProducer* producer{nullptr};
    };

    struct Options {
        std::string defaultReplyTo{"inventory.replies"};
        bool enableLogging{true};
    };

    using Handler = std::function<void(const nlohmann::json& request, nlohmann::json& reply)>;

    InventoryCommandRouter(Dependencies deps);
    InventoryCommandRouter(Dependencies deps, Options options);

    void Initialize();  // 注册所有命令处理函数
    void Start();  // 启动消费
    void Stop();  // 停止消费

    // 处理一条命令并返回应答 JSON（不发布）；任何错误都体现在应答中
    std::string Dispatch(const std::string& payload);

private:
    void routeMessage(const std::string& payload);
    void registerHandler(std::string_view command, Handler handler);

    void onReserve(const nlohmann::json& request, nlohmann::json& reply);
    void onConfirm(const nlohmann::json& request, nlohmann::json& reply);
    void onRelease(const nlohmann::json& request, nlohmann::json& reply);
    void onAdjust(const nlohmann::json& request, nlohmann::json& reply);
    void onCheck(const nlohmann::json& request, nlohmann::json& reply);

private:
    Dependencies deps_;
    Options options_;
    std::unordered_map<std::string, Handler> handlers_;
    bool running_{false};
};
