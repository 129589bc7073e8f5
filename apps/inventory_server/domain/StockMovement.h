#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/InventoryLedger.h"

enum class MovementType : std::uint8_t { kIncoming = 0, kOutgoing, kReserved, kReleased, kSold, kAdjustmentIn, kAdjustmentOut };

std::string ToString(MovementType type);
MovementType MovementTypeFromString(std::string_view type);

// 库存流水：一次计数变化的不可变审计记录，只追加不修改
struct StockMovement {
    using Clock = std::chrono::system_clock;

    std::int64_t id{0};  // 由存储层分配
    std::int64_t ledgerId{0};
    StockKey key;
    MovementType type{MovementType::kIncoming};
    int quantityChange{0};  // 恒为正，方向由 type 表达
    std::string reason;
    std::optional<std::string> referenceId;
    std::optional<std::string> actor;
    Clock::time_point occurredAt{};

    static StockMovement Of(const InventoryLedger& ledger,
                            MovementType type,
                            int quantity,
                            std::string reason,
                            std::optional<std::string> referenceId,
                            std::optional<std::string> actor,
                            Clock::time_point now);
};
