#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "domain/InventoryLedger.h"

// 商品目录（外部系统）：只关心商品是否存在
class ProductCatalog {
public:
    virtual ~ProductCatalog() = default;
    virtual bool ProductExists(const std::string& productRef) = 0;
};

// 出站库存事件，发送即忘：实现方自行记录失败，不向调用方抛出
class StockEventPublisher {
public:
    using Clock = std::chrono::system_clock;

    virtual ~StockEventPublisher() = default;
    virtual void PublishLowStock(const InventoryLedger& ledger, Clock::time_point occurredAt) = 0;
    virtual void PublishStockChanged(const InventoryLedger& ledger, std::string_view operation, Clock::time_point occurredAt) = 0;
};

// 每次提交后显式失效该库存维度的缓存
class StockCacheInvalidator {
public:
    virtual ~StockCacheInvalidator() = default;
    virtual void Invalidate(const StockKey& key) = 0;
};

// 台账快照读缓存
class LedgerSnapshotCache {
public:
    virtual ~LedgerSnapshotCache() = default;
    virtual std::optional<InventoryLedger> GetLedger(const StockKey& key) = 0;
    virtual void PutLedger(const InventoryLedger& ledger) = 0;
};
