#include "domain/InventoryStore.h"

std::string ToString(LedgerFilter filter) {
    switch (filter) {
        case LedgerFilter::kLowStock:         return "low_stock";
        case LedgerFilter::kOutOfStock:       return "out_of_stock";
        case LedgerFilter::kBelowMinimum:     return "below_minimum";
        case LedgerFilter::kWithReservations: return "with_reservations";
    }
    return "unknown";
}

std::optional<LedgerFilter> LedgerFilterFromString(std::string_view s) {
    if (s == "low_stock")         return LedgerFilter::kLowStock;
    if (s == "out_of_stock")      return LedgerFilter::kOutOfStock;
    if (s == "below_minimum")     return LedgerFilter::kBelowMinimum;
    if (s == "with_reservations") return LedgerFilter::kWithReservations;
    return std::nullopt;
}
