#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/InventoryLedger.h"

enum class ReservationStatus : std::uint8_t { kActive = 0, kConfirmed, kReleased, kExpired };

std::string ToString(ReservationStatus status);
ReservationStatus ReservationStatusFromString(std::string_view status);

// 生成 UUID v4（OpenSSL RAND_bytes）
std::string GenerateReservationId();

/**
 * @brief Reservation：有时限的库存预留
 *
 * 生命周期：ACTIVE -> {CONFIRMED, RELEASED, EXPIRED}，终态不再流转。
 * 每个流转方法都需要传入所属台账，并在同一步中修改台账计数。
 */
class Reservation {
public:
    using Clock = std::chrono::system_clock;

    struct Record {
        std::string id;
        std::int64_t ledgerId{0};
        StockKey key;
        int quantity{0};
        std::string requesterId;
        std::optional<std::string> correlationId;
        std::optional<std::string> source;
        Clock::time_point createdAt{};
        Clock::time_point expiresAt{};
        ReservationStatus status{ReservationStatus::kActive};
        std::optional<Clock::time_point> resolvedAt;
        std::optional<std::string> resolutionReason;
    };

    Reservation() = default;
    explicit Reservation(Record record);

    static Reservation FromRecord(const Record& record);
    Record ToRecord() const;

    // 在台账上预留 quantity 并返回 ACTIVE 状态的预留单
    static Reservation Create(InventoryLedger& ledger,
                              int quantity,
                              std::string requesterId,
                              std::optional<std::string> correlationId,
                              std::optional<std::string> source,
                              Clock::time_point now,
                              std::chrono::seconds ttl);

    // ========= 状态机 =========
    void Confirm(InventoryLedger& ledger, Clock::time_point now);
    void Cancel(InventoryLedger& ledger, std::string reason, Clock::time_point now);
    // 非 ACTIVE 返回 false（幂等）；未到期抛 InvalidState
    bool Expire(InventoryLedger& ledger, Clock::time_point now);

    bool IsActive() const noexcept { return status_ == ReservationStatus::kActive; }
    bool IsExpiredAt(Clock::time_point now) const noexcept { return IsActive() && now >= expiresAt_; }

    // ========= 访问器 =========
    const std::string& id() const noexcept { return id_; }
    std::int64_t ledgerId() const noexcept { return ledgerId_; }
    const StockKey& key() const noexcept { return key_; }
    int quantity() const noexcept { return quantity_; }
    const std::string& requesterId() const noexcept { return requesterId_; }
    const std::optional<std::string>& correlationId() const noexcept { return correlationId_; }
    const std::optional<std::string>& source() const noexcept { return source_; }
    Clock::time_point createdAt() const noexcept { return createdAt_; }
    Clock::time_point expiresAt() const noexcept { return expiresAt_; }
    ReservationStatus status() const noexcept { return status_; }
    const std::optional<Clock::time_point>& resolvedAt() const noexcept { return resolvedAt_; }
    const std::optional<std::string>& resolutionReason() const noexcept { return resolutionReason_; }

private:
    void requireActive(std::string_view action) const;
    void requireLedger(const InventoryLedger& ledger) const;
    void resolve(ReservationStatus status, std::string reason, Clock::time_point now);

private:
    std::string id_;
    std::int64_t ledgerId_{0};
    StockKey key_;
    int quantity_{0};
    std::string requesterId_;
    std::optional<std::string> correlationId_;
    std::optional<std::string> source_;
    Clock::time_point createdAt_{};
    Clock::time_point expiresAt_{};
    ReservationStatus status_{ReservationStatus::kActive};
    std::optional<Clock::time_point> resolvedAt_;
    std::optional<std::string> resolutionReason_;
};
