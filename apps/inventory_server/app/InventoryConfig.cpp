#include "InventoryConfig.h"
#include "ConfigLoader.hpp"

InventoryServerOptions InventoryServerOptions::FromConfig(const std::string& path) {
    ConfigLoader cfg(path);
    return FromLoader(cfg);
}

InventoryServerOptions InventoryServerOptions::FromLoader(const ConfigLoader& cfg) {
    InventoryServerOptions opt;

    // --------------------------- 基础 ---------------------------
    opt.serviceName = cfg.get("serviceName", opt.serviceName);

    // --------------------------- Storage ---------------------------
    auto& storage = opt.storage;
    storage.backend = cfg.getPath("storage.backend", storage.backend);
    storage.ensureSchema = cfg.getPath("storage.ensureSchema", storage.ensureSchema);
    storage.ledgerTable = cfg.getPath("storage.ledgerTable", storage.ledgerTable);
    storage.reservationTable = cfg.getPath("storage.reservationTable", storage.reservationTable);
    storage.movementTable = cfg.getPath("storage.movementTable", storage.movementTable);

    // --------------------------- Database ---------------------------
    auto& db = opt.database;
    db.connInfo.url = cfg.getPath("database.connInfo.url", db.connInfo.url);
    db.connInfo.user = cfg.getPath("database.connInfo.user", db.connInfo.user);
    db.connInfo.password = cfg.getPath("database.connInfo.password", db.connInfo.password);
    db.connInfo.database = cfg.getPath("database.connInfo.database", db.connInfo.database);
    db.connInfo.charset = cfg.getPath("database.connInfo.charset", db.connInfo.charset);
    db.connInfo.timeout_sec = cfg.getPath("database.connInfo.timeout_sec", db.connInfo.timeout_sec);
    db.maxConnections = cfg.getPath("database.maxConnections", db.maxConnections);
    db.minConnections = cfg.getPath("database.minConnections", db.minConnections);
    db.maxIdleTime = cfg.getPath("database.maxIdleTime", db.maxIdleTime);
    db.connectTimeout = cfg.getPath("database.connectTimeout", db.connectTimeout);
    db.acquireTimeoutMs = cfg.getPath("database.acquireTimeoutMs", db.acquireTimeoutMs);

    // --------------------------- Redis ---------------------------
    auto& redis = opt.redis;
    redis.host = cfg.getPath("redis.host", redis.host);
    redis.port = cfg.getPath("redis.port", redis.port);
    redis.password = cfg.getPath("redis.password", redis.password);
    redis.poolSize = cfg.getPath("redis.poolSize", redis.poolSize);
    redis.timeoutMs = cfg.getPath("redis.timeoutMs", redis.timeoutMs);
    redis.keyPrefix = cfg.getPath("redis.keyPrefix", redis.keyPrefix);
    redis.snapshotTtlSeconds = cfg.getPath("redis.snapshotTtlSeconds", redis.snapshotTtlSeconds);
    redis.enableCache = cfg.getPath("redis.enableCache", redis.enableCache);

    // --------------------------- MQ ---------------------------
    auto& mq = opt.mq;
    mq.url = cfg.getPath("mq.url", mq.url);
    mq.exchange = cfg.getPath("mq.exchange", mq.exchange);
    mq.commandQueue = cfg.getPath("mq.commandQueue", mq.commandQueue);
    mq.replyRoutingKey = cfg.getPath("mq.replyRoutingKey", mq.replyRoutingKey);
    mq.lowStockRoutingKey = cfg.getPath("mq.lowStockRoutingKey", mq.lowStockRoutingKey);
    mq.stockChangedRoutingKey = cfg.getPath("mq.stockChangedRoutingKey", mq.stockChangedRoutingKey);
    mq.prefetch = static_cast<std::uint16_t>(cfg.getPath("mq.prefetch", static_cast<int>(mq.prefetch)));
    mq.enableConsumer = cfg.getPath("mq.enableConsumer", mq.enableConsumer);
    mq.enablePublisher = cfg.getPath("mq.enablePublisher", mq.enablePublisher);

    // --------------------------- Logging ---------------------------
    auto& log = opt.logging;
    log.level = cfg.getPath("logging.level", log.level);
    log.console = cfg.getPath("logging.console", log.console);
    log.file = cfg.getPath("logging.file", log.file);
    log.async = cfg.getPath("logging.async", log.async);

    // --------------------------- Reservation ---------------------------
    auto& resv = opt.reservation;
    resv.ttlSeconds = cfg.getPath("reservation.ttlSeconds", resv.ttlSeconds);
    resv.maxTtlSeconds = cfg.getPath("reservation.maxTtlSeconds", resv.maxTtlSeconds);
    resv.defaultMinimumStockLevel = cfg.getPath("reservation.defaultMinimumStockLevel", resv.defaultMinimumStockLevel);
    resv.defaultReorderPoint = cfg.getPath("reservation.defaultReorderPoint", resv.defaultReorderPoint);

    // --------------------------- Sweeper ---------------------------
    auto& sweeper = opt.sweeper;
    sweeper.enabled = cfg.getPath("sweeper.enabled", sweeper.enabled);
    sweeper.intervalSeconds = cfg.getPath("sweeper.intervalSeconds", sweeper.intervalSeconds);
    sweeper.batchSize = cfg.getPath("sweeper.batchSize", sweeper.batchSize);
    sweeper.runOnStart = cfg.getPath("sweeper.runOnStart", sweeper.runOnStart);

    // --------------------------- Catalog ---------------------------
    auto& catalog = opt.catalog;
    catalog.backend = cfg.getPath("catalog.backend", catalog.backend);
    catalog.table = cfg.getPath("catalog.table", catalog.table);
    catalog.skuColumn = cfg.getPath("catalog.skuColumn", catalog.skuColumn);
    catalog.products = cfg.getPath("catalog.products", catalog.products);
    catalog.acceptAll = cfg.getPath("catalog.acceptAll", catalog.acceptAll);

    // --------------------------- Retry ---------------------------
    auto& retry = opt.retry;
    retry.conflictRetries = cfg.getPath("retry.conflictRetries", retry.conflictRetries);
    retry.backoffMs = cfg.getPath("retry.backoffMs", retry.backoffMs);

    // --------------------------- 校验 ---------------------------
    if (!opt.validate()) {
        throw std::runtime_error("Invalid configuration detected");
    }

    return opt;
}
