#include "domain/StockMovement.h"

#include <format>
#include <stdexcept>
#include <utility>

#include "domain/InventoryErrors.h"

std::string ToString(MovementType type) {
    switch (type) {
        case MovementType::kIncoming:      return "INCOMING";
        case MovementType::kOutgoing:      return "OUTGOING";
        case MovementType::kReserved:      return "RESERVED";
        case MovementType::kReleased:      return "RELEASED";
        case MovementType::kSold:          return "SOLD";
        case MovementType::kAdjustmentIn:  return "ADJUSTMENT_IN";
        case MovementType::kAdjustmentOut: return "ADJUSTMENT_OUT";
    }
    return "UNKNOWN";
}

MovementType MovementTypeFromString(std::string_view s) {
    if (s == "INCOMING")       return MovementType::kIncoming;
    if (s == "OUTGOING")       return MovementType::kOutgoing;
    if (s == "RESERVED")       return MovementType::kReserved;
    if (s == "RELEASED")       return MovementType::kReleased;
    if (s == "SOLD")           return MovementType::kSold;
    if (s == "ADJUSTMENT_IN")  return MovementType::kAdjustmentIn;
    if (s == "ADJUSTMENT_OUT") return MovementType::kAdjustmentOut;
    throw std::invalid_argument(std::format("unknown movement type '{}'", s));
}

StockMovement StockMovement::Of(const InventoryLedger& ledger,
                                MovementType type,
                                int quantity,
                                std::string reason,
                                std::optional<std::string> referenceId,
                                std::optional<std::string> actor,
                                Clock::time_point now) {
    if (quantity <= 0)
        throw InvalidQuantity(quantity);

    StockMovement m;
    m.ledgerId = ledger.id();
    m.key = ledger.key();
    m.type = type;
    m.quantityChange = quantity;
    m.reason = std::move(reason);
    m.referenceId = std::move(referenceId);
    m.actor = std::move(actor);
    m.occurredAt = now;
    return m;
}
