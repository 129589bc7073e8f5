#include "domain/Reservation.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdio>
#include <format>
#include <stdexcept>
#include <utility>

#include "domain/InventoryErrors.h"
#include "LogMacros.h"

// ------------------- 枚举与标识 -------------------

std::string ToString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::kActive:    return "ACTIVE";
        case ReservationStatus::kConfirmed: return "CONFIRMED";
        case ReservationStatus::kReleased:  return "RELEASED";
        case ReservationStatus::kExpired:   return "EXPIRED";
    }
    return "UNKNOWN";
}

ReservationStatus ReservationStatusFromString(std::string_view s) {
    if (s == "ACTIVE")    return ReservationStatus::kActive;
    if (s == "CONFIRMED") return ReservationStatus::kConfirmed;
    if (s == "RELEASED")  return ReservationStatus::kReleased;
    if (s == "EXPIRED")   return ReservationStatus::kExpired;
    throw std::invalid_argument(std::format("unknown reservation status '{}'", s));
}

std::string GenerateReservationId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // 熵源不可用时不降级为可预测的 ID
        char reason[256] = "unknown";
        if (unsigned long err = ERR_get_error(); err != 0)
            ERR_error_string_n(err, reason, sizeof(reason));
        LOG_ERROR("[Reservation] RAND_bytes failed: {}", reason);
        throw StorageFailure(std::format("cannot generate reservation id: {}", reason));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf, 36);
}

// ------------------- 构造与映射 -------------------

Reservation::Reservation(Record record) :
    id_(std::move(record.id)),
    ledgerId_(record.ledgerId),
    key_(std::move(record.key)),
    quantity_(record.quantity),
    requesterId_(std::move(record.requesterId)),
    correlationId_(std::move(record.correlationId)),
    source_(std::move(record.source)),
    createdAt_(record.createdAt),
    expiresAt_(record.expiresAt),
    status_(record.status),
    resolvedAt_(record.resolvedAt),
    resolutionReason_(std::move(record.resolutionReason)) {}

Reservation Reservation::FromRecord(const Record& record) {
    return Reservation(record);
}

Reservation::Record Reservation::ToRecord() const {
    Record r;
    r.id = id_;
    r.ledgerId = ledgerId_;
    r.key = key_;
    r.quantity = quantity_;
    r.requesterId = requesterId_;
    r.correlationId = correlationId_;
    r.source = source_;
    r.createdAt = createdAt_;
    r.expiresAt = expiresAt_;
    r.status = status_;
    r.resolvedAt = resolvedAt_;
    r.resolutionReason = resolutionReason_;
    return r;
}

// ------------------- 状态机 -------------------

Reservation Reservation::Create(InventoryLedger& ledger,
                                int quantity,
                                std::string requesterId,
                                std::optional<std::string> correlationId,
                                std::optional<std::string> source,
                                Clock::time_point now,
                                std::chrono::seconds ttl) {
    if (quantity <= 0)
        throw InvalidQuantity(quantity);
    std::string id = GenerateReservationId();
    ledger.Reserve(quantity, now);

    Reservation r;
    r.id_ = std::move(id);
    r.ledgerId_ = ledger.id();
    r.key_ = ledger.key();
    r.quantity_ = quantity;
    r.requesterId_ = std::move(requesterId);
    r.correlationId_ = std::move(correlationId);
    r.source_ = std::move(source);
    r.createdAt_ = now;
    r.expiresAt_ = now + ttl;
    r.status_ = ReservationStatus::kActive;
    return r;
}

void Reservation::Confirm(InventoryLedger& ledger, Clock::time_point now) {
    requireLedger(ledger);
    requireActive("confirm");
    ledger.ConfirmSale(quantity_, now);
    resolve(ReservationStatus::kConfirmed, "confirmed", now);
}

void Reservation::Cancel(InventoryLedger& ledger, std::string reason, Clock::time_point now) {
    requireLedger(ledger);
    requireActive("release");
    ledger.Release(quantity_, now);
    resolve(ReservationStatus::kReleased, std::move(reason), now);
}

bool Reservation::Expire(InventoryLedger& ledger, Clock::time_point now) {
    requireLedger(ledger);
    if (!IsActive())
        return false;
    if (now < expiresAt_)
        throw InvalidState(id_, "cannot expire before expiresAt");
    ledger.Release(quantity_, now);
    resolve(ReservationStatus::kExpired, "expired", now);
    return true;
}

void Reservation::requireActive(std::string_view action) const {
    if (!IsActive())
        throw InvalidState(id_, std::format("cannot {} a reservation in state {}", action, ToString(status_)));
}

void Reservation::requireLedger(const InventoryLedger& ledger) const {
    if (ledger.id() != ledgerId_)
        throw std::invalid_argument(std::format("reservation {} belongs to ledger {}, got ledger {}", id_, ledgerId_, ledger.id()));
}

void Reservation::resolve(ReservationStatus status, std::string reason, Clock::time_point now) {
    status_ = status;
    resolvedAt_ = now;
    resolutionReason_ = std::move(reason);
}
