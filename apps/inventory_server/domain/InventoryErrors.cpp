#include "domain/InventoryErrors.h"

#include <format>

std::string ToString(InventoryErrc code) {
    switch (code) {
        case InventoryErrc::kInsufficientStock:   return "INSUFFICIENT_STOCK";
        case InventoryErrc::kInvalidRelease:      return "INVALID_RELEASE";
        case InventoryErrc::kInvalidConfirm:      return "INVALID_CONFIRM";
        case InventoryErrc::kInvalidAdjustment:   return "INVALID_ADJUSTMENT";
        case InventoryErrc::kInvalidQuantity:     return "INVALID_QUANTITY";
        case InventoryErrc::kInvalidArgument:     return "INVALID_ARGUMENT";
        case InventoryErrc::kReservationNotFound: return "RESERVATION_NOT_FOUND";
        case InventoryErrc::kInvalidState:        return "INVALID_STATE";
        case InventoryErrc::kProductNotTracked:   return "PRODUCT_NOT_TRACKED";
        case InventoryErrc::kProductNotFound:     return "PRODUCT_NOT_FOUND";
        case InventoryErrc::kConcurrencyConflict: return "CONCURRENCY_CONFLICT";
        case InventoryErrc::kStorageFailure:      return "STORAGE_FAILURE";
    }
    return "UNKNOWN";
}

InsufficientStock::InsufficientStock(int requested, int available) :
    InventoryError(InventoryErrc::kInsufficientStock, std::format("insufficient stock: requested {}, available {}", requested, available)),
    requested_(requested),
    available_(available) {}

InvalidRelease::InvalidRelease(int quantity, int reserved) :
    InventoryError(InventoryErrc::kInvalidRelease, std::format("cannot release {} units, only {} reserved", quantity, reserved)) {}

InvalidConfirm::InvalidConfirm(int quantity, int reserved) :
    InventoryError(InventoryErrc::kInvalidConfirm, std::format("cannot confirm {} units, only {} reserved", quantity, reserved)) {}

InvalidQuantity::InvalidQuantity(int quantity) : InventoryError(InventoryErrc::kInvalidQuantity, std::format("quantity must be positive, got {}", quantity)) {}

ReservationNotFound::ReservationNotFound(const std::string& reservationId) :
    InventoryError(InventoryErrc::kReservationNotFound, std::format("reservation {} not found", reservationId)) {}

InvalidState::InvalidState(const std::string& reservationId, std::string_view detail) :
    InventoryError(InventoryErrc::kInvalidState, std::format("reservation {}: {}", reservationId, detail)) {}

ProductNotTracked::ProductNotTracked(const std::string& stockKey) :
    InventoryError(InventoryErrc::kProductNotTracked, std::format("no inventory ledger for {}", stockKey)) {}

ProductNotFound::ProductNotFound(const std::string& productRef) :
    InventoryError(InventoryErrc::kProductNotFound, std::format("product {} does not exist in catalog", productRef)) {}
