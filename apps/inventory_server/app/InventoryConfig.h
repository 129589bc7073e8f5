#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "MySQLConnInfo.h"

class ConfigLoader;

// --------------------------- Storage ---------------------------
struct StorageOptions {
    std::string backend{"mysql"};  // mysql | memory
    bool ensureSchema{true};
    std::string ledgerTable{"inventory_ledgers"};
    std::string reservationTable{"stock_reservations"};
    std::string movementTable{"stock_movements"};

    bool useMySQL() const { return backend == "mysql"; }
    bool validate() const { return (backend == "mysql" || backend == "memory") && !ledgerTable.empty() && !reservationTable.empty() && !movementTable.empty(); }
};

// --------------------------- Database ---------------------------
struct DatabaseOptions {
    MySQLConnInfo connInfo;
    int maxConnections{16};
    int minConnections{4};
    int maxIdleTime{60};
    int connectTimeout{5};
    int acquireTimeoutMs{3000};

    bool validate() const { return connInfo.validate() && minConnections > 0 && maxConnections >= minConnections && acquireTimeoutMs > 0; }
};

// --------------------------- Redis ---------------------------
struct RedisOptions {
    std::string host{"127.0.0.1"};
    int port{6379};
    std::string password;
    std::size_t poolSize{4};
    int timeoutMs{1000};
    std::string keyPrefix{"inventory:"};
    int snapshotTtlSeconds{30};
    bool enableCache{true};

    bool validate() const { return !host.empty() && port > 0 && port < 65536 && poolSize > 0 && snapshotTtlSeconds >= 0; }
};

// --------------------------- MQ ---------------------------
struct MQOptions {
    std::string url;  // 为空则不启用 MQ
    std::string exchange{"inventory.exchange"};
    std::string commandQueue{"inventory.commands"};
    std::string replyRoutingKey{"inventory.replies"};
    std::string lowStockRoutingKey{"inventory.low_stock"};
    std::string stockChangedRoutingKey{"inventory.stock_changed"};
    std::uint16_t prefetch{32};
    bool enableConsumer{true};
    bool enablePublisher{true};

    bool enabled() const { return !url.empty(); }
    bool validate() const { return !enabled() || (!commandQueue.empty() && !replyRoutingKey.empty()); }
};

// --------------------------- Logging ---------------------------
struct LoggingOptions {
    std::string level{"INFO"};
    bool console{true};
    std::string file;  // 为空则不写文件
    bool async{true};
};

// --------------------------- Reservation ---------------------------
struct ReservationOptions {
    int ttlSeconds{1800};
    int maxTtlSeconds{86400};
    int defaultMinimumStockLevel{5};
    int defaultReorderPoint{10};

    bool validate() const { return ttlSeconds > 0 && maxTtlSeconds >= ttlSeconds && defaultMinimumStockLevel >= 0 && defaultReorderPoint >= 0; }
};

// --------------------------- Sweeper ---------------------------
struct SweeperOptions {
    bool enabled{true};
    int intervalSeconds{60};
    std::size_t batchSize{200};
    bool runOnStart{true};

    bool validate() const { return intervalSeconds > 0 && batchSize > 0; }
};

// --------------------------- Catalog ---------------------------
struct CatalogOptions {
    std::string backend{"mysql"};  // mysql | memory | none
    std::string table{"products"};
    std::string skuColumn{"sku"};
    std::vector<std::string> products;  // memory 后端的商品清单
    bool acceptAll{false};  // memory 后端：不校验商品

    bool validate() const { return backend == "mysql" || backend == "memory" || backend == "none"; }
};

// --------------------------- Retry ---------------------------
struct RetryOptions {
    int conflictRetries{3};
    int backoffMs{20};

    bool validate() const { return conflictRetries >= 0 && backoffMs >= 0; }
};

// --------------------------- InventoryServer ---------------------------
struct InventoryServerOptions {
    std::string serviceName{"InventoryServer"};

    StorageOptions storage;
    DatabaseOptions database;
    RedisOptions redis;
    MQOptions mq;
    LoggingOptions logging;
    ReservationOptions reservation;
    SweeperOptions sweeper;
    CatalogOptions catalog;
    RetryOptions retry;

    bool needsMySQL() const { return storage.useMySQL() || catalog.backend == "mysql"; }

    bool validate() const {
        return !serviceName.empty() && storage.validate() && (!needsMySQL() || database.validate()) && (!redis.enableCache || redis.validate()) && mq.validate() &&
               reservation.validate() && sweeper.validate() && catalog.validate() && retry.validate();
    }

    static InventoryServerOptions FromConfig(const std::string& path);
    static InventoryServerOptions FromLoader(const ConfigLoader& cfg);
};
