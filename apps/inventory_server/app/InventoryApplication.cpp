#include "app/InventoryApplication.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "EventLoop.h"
#include "LogMacros.h"
#include "Logger.h"
#include "MQClient.h"
#include "MQConsumer.h"
#include "MQProducer.h"
#include "MySQLConnPool.h"
#include "RedisPool.h"

#include "domain/ExpirationSweeper.h"
#include "domain/InventoryDomainService.h"
#include "infra/cache/InventoryCache.h"
#include "infra/db/MySQLInventoryStore.h"
#include "infra/db/MySQLProductCatalog.h"
#include "infra/memory/InMemoryInventoryStore.h"
#include "infra/memory/InMemoryProductCatalog.h"
#include "infra/mq/InventoryEventConsumer.h"
#include "infra/mq/MQStockEventPublisher.h"
#include "interface/mq/InventoryCommandRouter.h"

InventoryApplication::InventoryApplication(EventLoop* loop, Options options) : loop_(loop), options_(std::move(options)) {}

InventoryApplication::~InventoryApplication() {
    stop();
    if (mysqlPool_)
        mysqlPool_->Shutdown();
}

void InventoryApplication::start() {
    if (started_)
        return;
    if (!loop_) {
        throw std::runtime_error("InventoryApplication requires a valid EventLoop");
    }

    configureLogging();
    initStorage();
    initCache();
    initMessageQueue();
    initDomain();
    initRouter();

    if (sweeper_)
        sweeper_->Start();
    if (router_)
        router_->Start();

    started_ = true;
    LOG_INFO("InventoryApplication started successfully (storage={}, cache={}, mq={})", options_.storage.backend, cache_ ? "redis" : "off",
             mqClient_ ? "on" : "off");
}

void InventoryApplication::stop() {
    if (!started_)
        return;
    if (router_)
        router_->Stop();
    if (sweeper_)
        sweeper_->Stop();
    started_ = false;
    LOG_INFO("InventoryApplication stopped");
}

void InventoryApplication::configureLogging() {
    auto& logger = Logger::instance();
    logger.setLogLevel(LogLevelFromString(options_.logging.level));
    logger.setOutputToConsole(options_.logging.console);
    if (!options_.logging.file.empty()) {
        if (options_.logging.async)
            logger.setOutputToFileAsync(options_.logging.file);
        else
            logger.setOutputToFile(options_.logging.file);
    }
}

void InventoryApplication::initStorage() {
    if (options_.needsMySQL()) {
        if (!options_.database.validate())
            throw std::runtime_error("Invalid database configuration");

        const auto& db = options_.database;
        mysqlPool_ = MySQLConnPool::GetInstance(db.connInfo.database);
        mysqlPool_->InitPool(db.connInfo, db.minConnections, db.maxConnections, db.maxIdleTime, db.connectTimeout);
        if (mysqlPool_->TotalCount() == 0)
            LOG_WARN("No MySQL connection could be opened yet, requests will retry on demand");
    }

    if (options_.storage.useMySQL()) {
        MySQLInventoryStore::Options storeOptions;
        storeOptions.ledgerTable = options_.storage.ledgerTable;
        storeOptions.reservationTable = options_.storage.reservationTable;
        storeOptions.movementTable = options_.storage.movementTable;
        storeOptions.acquireTimeout = std::chrono::milliseconds(options_.database.acquireTimeoutMs);

        auto store = std::make_unique<MySQLInventoryStore>(mysqlPool_, storeOptions);
        if (options_.storage.ensureSchema)
            store->EnsureSchema();
        store_ = std::move(store);
    } else {
        LOG_WARN("Using in-memory inventory store, data will not survive a restart");
        store_ = std::make_unique<InMemoryInventoryStore>();
    }

    const auto& catalog = options_.catalog;
    if (catalog.backend == "mysql") {
        MySQLProductCatalog::Options catalogOptions;
        catalogOptions.table = catalog.table;
        catalogOptions.skuColumn = catalog.skuColumn;
        catalogOptions.acquireTimeout = std::chrono::milliseconds(options_.database.acquireTimeoutMs);
        catalog_ = std::make_unique<MySQLProductCatalog>(mysqlPool_, catalogOptions);
    } else if (catalog.backend == "memory") {
        catalog_ = std::make_unique<InMemoryProductCatalog>(catalog.products, catalog.acceptAll);
    }
}

void InventoryApplication::initCache() {
    if (!options_.redis.enableCache)
        return;
    if (!options_.redis.validate())
        throw std::runtime_error("Invalid redis configuration");

    const auto& redis = options_.redis;
    RedisPool::Options poolOptions;
    poolOptions.host = redis.host;
    poolOptions.port = redis.port;
    poolOptions.password = redis.password;
    poolOptions.poolSize = redis.poolSize;
    poolOptions.timeout = std::chrono::milliseconds(redis.timeoutMs);
    redisPool_ = std::make_shared<RedisPool>(poolOptions);

    InventoryCache::Options cacheOptions;
    cacheOptions.keyPrefix = redis.keyPrefix;
    cacheOptions.ttl = std::chrono::seconds(redis.snapshotTtlSeconds);
    cache_ = std::make_unique<InventoryCache>(redisPool_, cacheOptions);
}

void InventoryApplication::initMessageQueue() {
    if (!options_.mq.enabled()) {
        LOG_WARN("MQ url not configured, skipping MQ initialization");
        return;
    }

    mqClient_ = std::make_unique<MQClient>(loop_, options_.mq.url);
    if (options_.mq.enablePublisher) {
        mqProducer_ = std::make_unique<MQProducer>(mqClient_.get());
        mqProducer_->declareExchange(options_.mq.exchange);

        MQStockEventPublisher::Options pubOptions;
        pubOptions.exchange = options_.mq.exchange;
        pubOptions.lowStockRoutingKey = options_.mq.lowStockRoutingKey;
        pubOptions.stockChangedRoutingKey = options_.mq.stockChangedRoutingKey;
        publisher_ = std::make_unique<MQStockEventPublisher>(MQStockEventPublisher::Dependencies{mqProducer_.get(), loop_}, pubOptions);
    }
    if (options_.mq.enableConsumer)
        mqConsumer_ = std::make_unique<MQConsumer>(mqClient_.get());
}

void InventoryApplication::initDomain() {
    if (!store_)
        throw std::runtime_error("Inventory store not initialized");

    InventoryDomainService::Dependencies deps;
    deps.store = store_.get();
    deps.catalog = catalog_.get();
    deps.events = publisher_.get();
    deps.invalidator = cache_.get();
    deps.snapshots = cache_.get();

    InventoryDomainService::Options serviceOptions;
    serviceOptions.defaultReservationTtl = std::chrono::seconds(options_.reservation.ttlSeconds);
    serviceOptions.maxReservationTtl = std::chrono::seconds(options_.reservation.maxTtlSeconds);
    serviceOptions.defaultMinimumStockLevel = options_.reservation.defaultMinimumStockLevel;
    serviceOptions.defaultReorderPoint = options_.reservation.defaultReorderPoint;
    serviceOptions.conflictRetries = options_.retry.conflictRetries;
    serviceOptions.retryBackoff = std::chrono::milliseconds(options_.retry.backoffMs);
    serviceOptions.sweepBatchSize = options_.sweeper.batchSize;

    service_ = std::make_unique<InventoryDomainService>(deps, serviceOptions);

    if (options_.sweeper.enabled) {
        ExpirationSweeper::Options sweeperOptions;
        sweeperOptions.interval = std::chrono::seconds(options_.sweeper.intervalSeconds);
        sweeperOptions.runOnStart = options_.sweeper.runOnStart;
        sweeper_ = std::make_unique<ExpirationSweeper>(service_.get(), sweeperOptions);
    }
}

void InventoryApplication::initRouter() {
    if (!mqConsumer_)
        return;

    InventoryEventConsumer::Options consumerOptions;
    consumerOptions.queueName = options_.mq.commandQueue;
    consumerOptions.prefetch = options_.mq.prefetch;
    commandConsumer_ = std::make_unique<InventoryEventConsumer>(InventoryEventConsumer::Dependencies{mqConsumer_.get()}, consumerOptions);

    InventoryCommandRouter::Dependencies deps;
    deps.consumer = commandConsumer_.get();
    deps.inventory = service_.get();
    deps.producer = mqProducer_.get();

    InventoryCommandRouter::Options routerOptions;
    routerOptions.defaultReplyTo = options_.mq.replyRoutingKey;
    router_ = std::make_unique<InventoryCommandRouter>(deps, routerOptions);
    router_->Initialize();
}
