#include "domain/InventoryLedger.h"

#include <format>
#include <functional>
#include <utility>

#include "domain/InventoryErrors.h"

// ========== StockKey ==========

StockKey StockKey::Of(std::string productRef, std::optional<std::string> variantRef) {
    StockKey key;
    key.productRef = std::move(productRef);
    if (variantRef && !variantRef->empty())
        key.variantRef = std::move(variantRef);
    return key;
}

std::string StockKey::ToString() const {
    if (!variantRef)
        return productRef;
    return productRef + ":" + *variantRef;
}

std::size_t StockKeyHash::operator()(const StockKey& key) const noexcept {
    std::size_t h = std::hash<std::string>{}(key.productRef);
    if (key.variantRef)
        h ^= std::hash<std::string>{}(*key.variantRef) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

// ========== 构造与映射 ==========

InventoryLedger::InventoryLedger(StockKey key, int minimumStockLevel, int reorderPoint, Clock::time_point now) :
    key_(std::move(key)), lastUpdated_(now) {
    SetThresholds(minimumStockLevel, reorderPoint, now);
}

InventoryLedger::InventoryLedger(Record record) :
    id_(record.id),
    key_(std::move(record.key)),
    available_(record.quantityAvailable),
    reserved_(record.quantityReserved),
    minimumStockLevel_(record.minimumStockLevel),
    reorderPoint_(record.reorderPoint),
    lastUpdated_(record.lastUpdated),
    version_(record.version) {}

InventoryLedger InventoryLedger::FromRecord(const Record& record) {
    return InventoryLedger(record);
}

InventoryLedger::Record InventoryLedger::ToRecord() const {
    Record r;
    r.id = id_;
    r.key = key_;
    r.quantityAvailable = available_;
    r.quantityReserved = reserved_;
    r.minimumStockLevel = minimumStockLevel_;
    r.reorderPoint = reorderPoint_;
    r.lastUpdated = lastUpdated_;
    r.version = version_;
    return r;
}

// ========== 状态流转 ==========

bool InventoryLedger::CanReserve(int quantity) const noexcept {
    return quantity > 0 && quantity <= available_;
}

void InventoryLedger::Reserve(int quantity, Clock::time_point now) {
    if (!CanReserve(quantity))
        throw InsufficientStock(quantity, available_);
    available_ -= quantity;
    reserved_ += quantity;
    lastUpdated_ = now;
}

void InventoryLedger::Release(int quantity, Clock::time_point now) {
    if (quantity <= 0 || quantity > reserved_)
        throw InvalidRelease(quantity, reserved_);
    reserved_ -= quantity;
    available_ += quantity;
    lastUpdated_ = now;
}

void InventoryLedger::ConfirmSale(int quantity, Clock::time_point now) {
    if (quantity <= 0 || quantity > reserved_)
        throw InvalidConfirm(quantity, reserved_);
    // 已售出的数量离开台账，available 不变
    reserved_ -= quantity;
    lastUpdated_ = now;
}

void InventoryLedger::AdjustTotalTo(int newTotal, Clock::time_point now) {
    if (newTotal < 0)
        throw InvalidAdjustment(std::format("total on hand cannot be negative, got {}", newTotal));
    if (newTotal < reserved_)
        throw InvalidAdjustment(std::format("total on hand {} is below reserved quantity {}", newTotal, reserved_));
    available_ = newTotal - reserved_;
    lastUpdated_ = now;
}

void InventoryLedger::SetThresholds(int minimumStockLevel, int reorderPoint, Clock::time_point now) {
    if (minimumStockLevel < 0 || reorderPoint < 0)
        throw InvalidAdjustment(std::format("thresholds must be non-negative, got minimum={} reorderPoint={}", minimumStockLevel, reorderPoint));
    minimumStockLevel_ = minimumStockLevel;
    reorderPoint_ = reorderPoint;
    lastUpdated_ = now;
}
