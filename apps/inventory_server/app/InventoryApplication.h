#pragma once
#include "InventoryConfig.h"

#include <memory>

#include "NonCopyable.h"

// 前置声明：解耦具体实现
class EventLoop;
class RedisPool;
class MySQLConnPool;
class MQClient;
class MQConsumer;
class MQProducer;
class InventoryStore;
class ProductCatalog;
class InventoryCache;
class MQStockEventPublisher;
class InventoryEventConsumer;
class InventoryDomainService;
class ExpirationSweeper;
class InventoryCommandRouter;

/**
 * @brief InventoryApplication：库存服务主协调器
 *
 * 功能职责：
 *  1. 按配置初始化日志、MySQL / 内存存储、Redis 缓存
 *  2. 初始化 MQ 客户端：库存事件发布与命令队列消费
 *  3. 组装领域服务、过期清理定时任务与命令路由
 *
 * 生命周期：start() 在主 loop 线程调用；析构时按依赖逆序停止各组件。
 */
class InventoryApplication : public NonCopyable {
public:
    using Options = InventoryServerOptions;

    // ===== 构造与析构 =====
    explicit InventoryApplication(EventLoop* loop, Options options = Options());
    ~InventoryApplication();

    // ===== 生命周期控制 =====
    void start();  // 启动整个服务（幂等）
    void stop();  // 停止清理任务与命令消费（幂等）
    bool isStarted() const noexcept { return started_; }

    // ===== 对外扩展接口 =====
    const Options& options() const noexcept { return options_; }
    InventoryStore* store() const noexcept { return store_.get(); }
    InventoryDomainService* service() const noexcept { return service_.get(); }
    ExpirationSweeper* sweeper() const noexcept { return sweeper_.get(); }
    InventoryCommandRouter* router() const noexcept { return router_.get(); }
    InventoryCache* cache() const noexcept { return cache_.get(); }

private:
    // ===== 内部初始化阶段 =====
    void configureLogging();
    void initStorage();  // MySQL 连接池 / 存储 / 商品目录
    void initCache();  // Redis
    void initMessageQueue();  // MQ 客户端、发布者与消费者
    void initDomain();  // 领域服务与清理任务
    void initRouter();  // 命令路由

private:
    // ===== 核心组件 =====
    EventLoop* loop_;  // 主事件循环（非拥有）
    Options options_;

    // ===== 中间件与资源层 =====
    std::shared_ptr<MySQLConnPool> mysqlPool_;
    std::shared_ptr<RedisPool> redisPool_;
    std::unique_ptr<MQClient> mqClient_;
    std::unique_ptr<MQProducer> mqProducer_;
    std::unique_ptr<MQConsumer> mqConsumer_;

    // ===== 数据与业务逻辑层 =====
    std::unique_ptr<InventoryStore> store_;
    std::unique_ptr<ProductCatalog> catalog_;
    std::unique_ptr<InventoryCache> cache_;
    std::unique_ptr<MQStockEventPublisher> publisher_;
    std::unique_ptr<InventoryDomainService> service_;
    std::unique_ptr<ExpirationSweeper> sweeper_;
    std::unique_ptr<InventoryEventConsumer> commandConsumer_;
    std::unique_ptr<InventoryCommandRouter> router_;

    bool started_{false};  // 防止重复启动
};
