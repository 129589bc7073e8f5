#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// 库存维度：商品，或商品 + 规格
struct StockKey {
    std::string productRef;
    std::optional<std::string> variantRef;

    // 空字符串规格与无规格等价，统一规范为 nullopt
    static StockKey Of(std::string productRef, std::optional<std::string> variantRef = std::nullopt);

    // "product" 或 "product:variant"，用于日志与缓存键
    std::string ToString() const;

    bool operator==(const StockKey& other) const = default;
};

struct StockKeyHash {
    std::size_t operator()(const StockKey& key) const noexcept;
};

/**
 * @brief InventoryLedger：单个商品（规格）的库存台账
 *
 * 只做纯内存状态流转，持久化由 InventoryUnitOfWork 完成。
 * 所有变更先校验后修改，校验失败抛出异常且台账保持不变。
 * 不变量：available >= 0，reserved >= 0，
 *        available + reserved 只会因显式调整或确认出库而变化。
 */
class InventoryLedger {
public:
    using Clock = std::chrono::system_clock;

    static constexpr int kDefaultMinimumStockLevel = 5;
    static constexpr int kDefaultReorderPoint = 10;

    struct Record {
        std::int64_t id{0};
        StockKey key;
        int quantityAvailable{0};
        int quantityReserved{0};
        int minimumStockLevel{kDefaultMinimumStockLevel};
        int reorderPoint{kDefaultReorderPoint};
        Clock::time_point lastUpdated{};
        std::int64_t version{0};
    };

    InventoryLedger() = default;
    InventoryLedger(StockKey key, int minimumStockLevel, int reorderPoint, Clock::time_point now);
    explicit InventoryLedger(Record record);

    static InventoryLedger FromRecord(const Record& record);
    Record ToRecord() const;

    // ========= 标识信息 =========
    std::int64_t id() const noexcept { return id_; }
    const StockKey& key() const noexcept { return key_; }
    std::int64_t version() const noexcept { return version_; }

    // 仅供存储层回填
    void SetId(std::int64_t id) noexcept { id_ = id; }
    void SetVersion(std::int64_t version) noexcept { version_ = version; }

    // ========= 计数 =========
    int quantityAvailable() const noexcept { return available_; }
    int quantityReserved() const noexcept { return reserved_; }
    int minimumStockLevel() const noexcept { return minimumStockLevel_; }
    int reorderPoint() const noexcept { return reorderPoint_; }
    Clock::time_point lastUpdated() const noexcept { return lastUpdated_; }

    // ========= 状态流转 =========
    bool CanReserve(int quantity) const noexcept;
    void Reserve(int quantity, Clock::time_point now = Clock::now());
    void Release(int quantity, Clock::time_point now = Clock::now());
    void ConfirmSale(int quantity, Clock::time_point now = Clock::now());
    void AdjustTotalTo(int newTotal, Clock::time_point now = Clock::now());
    void SetThresholds(int minimumStockLevel, int reorderPoint, Clock::time_point now = Clock::now());

    // ========= 谓词 =========
    bool IsOutOfStock() const noexcept { return available_ == 0; }
    bool IsLowStock() const noexcept { return available_ <= reorderPoint_; }
    bool IsBelowMinimum() const noexcept { return available_ < minimumStockLevel_; }
    int TotalOnHand() const noexcept { return available_ + reserved_; }

private:
    std::int64_t id_{0};
    StockKey key_;
    int available_{0};
    int reserved_{0};
    int minimumStockLevel_{kDefaultMinimumStockLevel};
    int reorderPoint_{kDefaultReorderPoint};
    Clock::time_point lastUpdated_{};
    std::int64_t version_{0};
};
