#include "domain/InventoryDomainService.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>

#include "LogMacros.h"
#include "domain/InventoryErrors.h"

// ========== 构造函数 ==========

InventoryDomainService::InventoryDomainService(Dependencies deps) : InventoryDomainService(std::move(deps), Options{}) {}

InventoryDomainService::InventoryDomainService(Dependencies deps, Options options) :
    InventoryDomainService(std::move(deps), std::move(options), [] { return Clock::now(); }) {}

InventoryDomainService::InventoryDomainService(Dependencies deps, Options options, ClockFn clock) :
    deps_(std::move(deps)), options_(std::move(options)), clock_(std::move(clock)) {
    if (!deps_.store)
        throw std::invalid_argument("InventoryDomainService: InventoryStore cannot be null");
    if (!clock_)
        throw std::invalid_argument("InventoryDomainService: clock cannot be empty");
}

// ========== 内部辅助 ==========

template <typename Fn>
auto InventoryDomainService::withRetry(std::string_view operation, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const ConcurrencyConflict& e) {
            if (attempt > options_.conflictRetries) {
                LOG_WARN("[Inventory] {} gave up after {} attempts: {}", operation, attempt, e.what());
                throw;
            }
            LOG_DEBUG("[Inventory] {} conflict on attempt {}, retrying: {}", operation, attempt, e.what());
            std::this_thread::sleep_for(options_.retryBackoff * attempt);
        }
    }
}

void InventoryDomainService::afterCommit(const InventoryLedger& ledger, std::string_view operation, bool checkLowStock) {
    const auto ts = now();
    if (deps_.invalidator) {
        try {
            deps_.invalidator->Invalidate(ledger.key());
        } catch (const std::exception& e) {
            LOG_WARN("[Inventory] Cache invalidation for {} failed: {}", ledger.key().ToString(), e.what());
        }
    }
    if (!deps_.events)
        return;
    try {
        deps_.events->PublishStockChanged(ledger, operation, ts);
        if (checkLowStock && ledger.IsLowStock()) {
            LOG_INFO("[Inventory] Low stock for {}: available={} reorderPoint={}", ledger.key().ToString(), ledger.quantityAvailable(), ledger.reorderPoint());
            deps_.events->PublishLowStock(ledger, ts);
        }
    } catch (const std::exception& e) {
        LOG_WARN("[Inventory] Event publish for {} failed: {}", ledger.key().ToString(), e.what());
    }
}

std::chrono::seconds InventoryDomainService::resolveTtl(const std::optional<std::chrono::seconds>& requested) const {
    if (requested && requested->count() > 0)
        return std::min(*requested, options_.maxReservationTtl);
    return options_.defaultReservationTtl;
}

StockKey InventoryDomainService::makeKey(const std::string& productRef, const std::optional<std::string>& variantRef) const {
    if (productRef.empty())
        throw InvalidArgument("productRef must not be empty");
    return StockKey::Of(productRef, variantRef);
}

// ========== 预留 / 释放 / 确认 ==========

Reservation InventoryDomainService::ReserveStock(const ReserveRequest& request) {
    if (request.quantity <= 0)
        throw InvalidQuantity(request.quantity);
    if (request.requesterId.empty())
        throw InvalidArgument("requesterId must not be empty");
    const StockKey key = makeKey(request.productRef, request.variantRef);
    const auto ttl = resolveTtl(request.ttl);

    auto [reservation, ledger] = withRetry("ReserveStock", [&] {
        TransactionScope tx(*deps_.store);
        auto ledger = tx->LockLedger(key);
        if (!ledger)
            throw ProductNotTracked(key.ToString());

        const auto ts = now();
        auto reservation = Reservation::Create(*ledger, request.quantity, request.requesterId, request.correlationId, request.source, ts, ttl);
        tx->UpdateLedger(*ledger);
        tx->InsertReservation(reservation);

        auto movement = StockMovement::Of(*ledger, MovementType::kReserved, request.quantity, "reservation created", reservation.id(), request.requesterId, ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return std::make_pair(std::move(reservation), std::move(*ledger));
    });

    LOG_INFO("[Inventory] Reserved {} x {} for {} (reservation={})", request.quantity, key.ToString(), request.requesterId, reservation.id());
    afterCommit(ledger, "reserve", false);
    return reservation;
}

Reservation InventoryDomainService::ReleaseStock(const std::string& reservationId, const std::string& reason) {
    auto [reservation, ledger] = withRetry("ReleaseStock", [&] {
        TransactionScope tx(*deps_.store);
        auto reservation = tx->LockReservation(reservationId);
        if (!reservation)
            throw ReservationNotFound(reservationId);
        if (!reservation->IsActive())
            throw InvalidState(reservationId, std::format("cannot release a reservation in state {}", ToString(reservation->status())));

        auto ledger = tx->LockLedgerById(reservation->ledgerId());
        if (!ledger)
            throw StorageFailure(std::format("ledger {} of reservation {} is missing", reservation->ledgerId(), reservationId));

        const auto ts = now();
        reservation->Cancel(*ledger, reason.empty() ? std::string("released") : reason, ts);
        tx->UpdateLedger(*ledger);
        tx->UpdateReservation(*reservation);

        auto movement = StockMovement::Of(*ledger, MovementType::kReleased, reservation->quantity(), reason.empty() ? "reservation released" : reason, reservationId,
                                          reservation->requesterId(), ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return std::make_pair(std::move(*reservation), std::move(*ledger));
    });

    LOG_INFO("[Inventory] Released reservation {} ({} x {})", reservationId, reservation.quantity(), reservation.key().ToString());
    afterCommit(ledger, "release", false);
    return reservation;
}

Reservation InventoryDomainService::ConfirmReservation(const std::string& reservationId) {
    auto [reservation, ledger] = withRetry("ConfirmReservation", [&] {
        TransactionScope tx(*deps_.store);
        auto reservation = tx->LockReservation(reservationId);
        if (!reservation)
            throw ReservationNotFound(reservationId);
        if (!reservation->IsActive())
            throw InvalidState(reservationId, std::format("cannot confirm a reservation in state {}", ToString(reservation->status())));

        auto ledger = tx->LockLedgerById(reservation->ledgerId());
        if (!ledger)
            throw StorageFailure(std::format("ledger {} of reservation {} is missing", reservation->ledgerId(), reservationId));

        const auto ts = now();
        reservation->Confirm(*ledger, ts);
        tx->UpdateLedger(*ledger);
        tx->UpdateReservation(*reservation);

        auto movement = StockMovement::Of(*ledger, MovementType::kSold, reservation->quantity(), "reservation confirmed", reservationId, reservation->requesterId(), ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return std::make_pair(std::move(*reservation), std::move(*ledger));
    });

    LOG_INFO("[Inventory] Confirmed reservation {} ({} x {})", reservationId, reservation.quantity(), reservation.key().ToString());
    afterCommit(ledger, "confirm", true);
    return reservation;
}

// ========== 盘点与阈值 ==========

InventoryLedger InventoryDomainService::AdjustStock(const std::string& productRef,
                                                    const std::optional<std::string>& variantRef,
                                                    int newTotal,
                                                    const std::string& reason,
                                                    const std::optional<std::string>& actor) {
    const StockKey key = makeKey(productRef, variantRef);
    if (newTotal < 0)
        throw InvalidAdjustment(std::format("total on hand cannot be negative, got {}", newTotal));
    if (deps_.catalog && !deps_.catalog->ProductExists(key.productRef))
        throw ProductNotFound(key.productRef);

    auto [ledger, changed] = withRetry("AdjustStock", [&] {
        TransactionScope tx(*deps_.store);
        const auto ts = now();
        bool created = false;
        auto ledger = tx->LockLedger(key);
        if (!ledger) {
            ledger = tx->InsertLedger(InventoryLedger(key, options_.defaultMinimumStockLevel, options_.defaultReorderPoint, ts));
            created = true;
        }

        const int oldTotal = ledger->TotalOnHand();
        const int delta = newTotal - oldTotal;
        if (delta == 0) {
            // 总量不变：不写台账也不写流水
            tx.Commit();
            return std::make_pair(std::move(*ledger), created);
        }

        ledger->AdjustTotalTo(newTotal, ts);
        tx->UpdateLedger(*ledger);

        auto movement = StockMovement::Of(*ledger, delta > 0 ? MovementType::kIncoming : MovementType::kOutgoing, std::abs(delta), reason.empty() ? "stock adjustment" : reason,
                                          std::nullopt, actor, ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return std::make_pair(std::move(*ledger), true);
    });

    if (changed) {
        LOG_INFO("[Inventory] Adjusted {} to total {} (available={} reserved={})", key.ToString(), newTotal, ledger.quantityAvailable(), ledger.quantityReserved());
        afterCommit(ledger, "adjust", true);
    }
    return ledger;
}

InventoryLedger InventoryDomainService::CorrectStock(const std::string& productRef,
                                                     const std::optional<std::string>& variantRef,
                                                     int delta,
                                                     const std::string& reason,
                                                     const std::optional<std::string>& actor) {
    const StockKey key = makeKey(productRef, variantRef);
    if (delta == 0)
        throw InvalidQuantity(delta);
    // -INT_MIN 不可表示，流水数量无法记录
    if (delta == std::numeric_limits<int>::min())
        throw InvalidAdjustment(std::format("correction {} is out of range", delta));

    auto ledger = withRetry("CorrectStock", [&] {
        TransactionScope tx(*deps_.store);
        auto ledger = tx->LockLedger(key);
        if (!ledger)
            throw ProductNotTracked(key.ToString());

        const std::int64_t newTotal = static_cast<std::int64_t>(ledger->TotalOnHand()) + delta;
        if (newTotal < 0)
            throw InvalidAdjustment(std::format("total on hand cannot be negative, got {}", newTotal));
        if (newTotal > std::numeric_limits<int>::max())
            throw InvalidAdjustment(std::format("total on hand {} exceeds the supported maximum", newTotal));

        const auto ts = now();
        ledger->AdjustTotalTo(static_cast<int>(newTotal), ts);
        tx->UpdateLedger(*ledger);

        auto movement = StockMovement::Of(*ledger, delta > 0 ? MovementType::kAdjustmentIn : MovementType::kAdjustmentOut, std::abs(delta),
                                          reason.empty() ? "stocktake correction" : reason, std::nullopt, actor, ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return std::move(*ledger);
    });

    LOG_INFO("[Inventory] Corrected {} by {} (available={})", key.ToString(), delta, ledger.quantityAvailable());
    afterCommit(ledger, "correct", true);
    return ledger;
}

InventoryLedger InventoryDomainService::UpdateThresholds(const std::string& productRef, const std::optional<std::string>& variantRef, int minimumStockLevel, int reorderPoint) {
    const StockKey key = makeKey(productRef, variantRef);

    auto ledger = withRetry("UpdateThresholds", [&] {
        TransactionScope tx(*deps_.store);
        auto ledger = tx->LockLedger(key);
        if (!ledger)
            throw ProductNotTracked(key.ToString());
        ledger->SetThresholds(minimumStockLevel, reorderPoint, now());
        tx->UpdateLedger(*ledger);
        tx.Commit();
        return std::move(*ledger);
    });

    afterCommit(ledger, "thresholds", false);
    return ledger;
}

// ========== 查询 ==========

bool InventoryDomainService::IsStockAvailable(const std::string& productRef, const std::optional<std::string>& variantRef, int quantity) {
    if (quantity <= 0)
        return false;
    auto ledger = deps_.store->FindLedger(makeKey(productRef, variantRef));
    return ledger && ledger->CanReserve(quantity);
}

std::optional<InventoryLedger> InventoryDomainService::GetInventory(const std::string& productRef, const std::optional<std::string>& variantRef) {
    const StockKey key = makeKey(productRef, variantRef);
    if (deps_.snapshots) {
        try {
            if (auto cached = deps_.snapshots->GetLedger(key))
                return cached;
        } catch (const std::exception& e) {
            LOG_WARN("[Inventory] Snapshot cache read for {} failed: {}", key.ToString(), e.what());
        }
    }

    auto ledger = deps_.store->FindLedger(key);
    if (ledger && deps_.snapshots) {
        try {
            deps_.snapshots->PutLedger(*ledger);
            // 读库与回填之间可能有写入提交并已失效缓存；回填后复核版本，
            // 落后则再次失效，避免旧快照一直留到 TTL 到期
            auto latest = deps_.store->FindLedger(key);
            if (latest && latest->version() != ledger->version()) {
                LOG_DEBUG("[Inventory] Snapshot of {} went stale during refill (v{} -> v{})", key.ToString(), ledger->version(), latest->version());
                if (deps_.invalidator)
                    deps_.invalidator->Invalidate(key);
                ledger = std::move(latest);
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Inventory] Snapshot cache write for {} failed: {}", key.ToString(), e.what());
        }
    }
    return ledger;
}

int InventoryDomainService::GetAvailableQuantity(const std::string& productRef, const std::optional<std::string>& variantRef) {
    auto ledger = GetInventory(productRef, variantRef);
    return ledger ? ledger->quantityAvailable() : 0;
}

std::vector<InventoryDomainService::StockLevel> InventoryDomainService::BulkStockCheck(const std::vector<StockCheckItem>& items) {
    std::vector<StockLevel> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        StockLevel level;
        level.key = makeKey(item.productRef, item.variantRef);
        level.requested = item.quantity;
        if (auto ledger = deps_.store->FindLedger(level.key)) {
            level.tracked = true;
            level.quantityAvailable = ledger->quantityAvailable();
            level.quantityReserved = ledger->quantityReserved();
            level.inStock = item.quantity > 0 ? ledger->quantityAvailable() >= item.quantity : !ledger->IsOutOfStock();
            level.lowStock = ledger->IsLowStock();
        }
        result.push_back(std::move(level));
    }
    return result;
}

std::optional<Reservation> InventoryDomainService::GetReservation(const std::string& reservationId) {
    return deps_.store->FindReservation(reservationId);
}

std::vector<Reservation> InventoryDomainService::ListActiveReservations(const std::string& requesterId) {
    return deps_.store->FindActiveReservationsByRequester(requesterId);
}

std::vector<StockMovement> InventoryDomainService::ListMovements(const std::string& productRef, const std::optional<std::string>& variantRef, std::size_t limit) {
    if (limit == 0)
        return {};
    return deps_.store->ListMovements(makeKey(productRef, variantRef), std::min(limit, options_.maxMovementPage));
}

std::vector<StockMovement> InventoryDomainService::ListMovementsByReference(const std::string& referenceId) {
    return deps_.store->ListMovementsByReference(referenceId);
}

std::vector<InventoryLedger> InventoryDomainService::ListLedgers(LedgerFilter filter) {
    return deps_.store->ListLedgers(filter);
}

// ========== 过期处理 ==========

bool InventoryDomainService::ExpireReservation(const std::string& reservationId) {
    auto ledger = withRetry("ExpireReservation", [&]() -> std::optional<InventoryLedger> {
        TransactionScope tx(*deps_.store);
        auto reservation = tx->LockReservation(reservationId);
        if (!reservation)
            throw ReservationNotFound(reservationId);
        // 可能已被确认、释放或其他清理进程处理
        if (!reservation->IsActive())
            return std::nullopt;

        auto ledger = tx->LockLedgerById(reservation->ledgerId());
        if (!ledger)
            throw StorageFailure(std::format("ledger {} of reservation {} is missing", reservation->ledgerId(), reservationId));

        const auto ts = now();
        if (!reservation->Expire(*ledger, ts))
            return std::nullopt;
        tx->UpdateLedger(*ledger);
        tx->UpdateReservation(*reservation);

        auto movement = StockMovement::Of(*ledger, MovementType::kReleased, reservation->quantity(), "reservation expired", reservationId, reservation->requesterId(), ts);
        tx->AppendMovement(movement);
        tx.Commit();
        return ledger;
    });

    if (!ledger)
        return false;
    LOG_INFO("[Inventory] Expired reservation {} on {}", reservationId, ledger->key().ToString());
    afterCommit(*ledger, "expire", false);
    return true;
}

InventoryDomainService::SweepReport InventoryDomainService::CleanupExpiredReservations() {
    SweepReport report;
    const auto cutoff = now();
    const std::size_t batchSize = std::max<std::size_t>(1, options_.sweepBatchSize);
    std::optional<ExpiryCursor> cursor;

    for (;;) {
        auto batch = deps_.store->FindExpiredReservations(cutoff, batchSize, cursor);
        for (const auto& reservation : batch) {
            ++report.scanned;
            try {
                if (ExpireReservation(reservation.id()))
                    ++report.expired;
                else
                    ++report.skipped;
            } catch (const InventoryError& e) {
                ++report.failed;
                LOG_WARN("[Inventory] Failed to expire reservation {} ({}): {}", reservation.id(), ToString(e.code()), e.what());
            } catch (const std::exception& e) {
                ++report.failed;
                LOG_ERROR("[Inventory] Unexpected error expiring reservation {}: {}", reservation.id(), e.what());
            }
        }
        // 游标越过本批（含失败的预留单），失败残留不会挡住后面的行
        if (batch.size() < batchSize)
            break;
        cursor = ExpiryCursor{batch.back().expiresAt(), batch.back().id()};
    }

    if (report.scanned > 0) {
        LOG_INFO("[Inventory] Expiration sweep: scanned={} expired={} skipped={} failed={}", report.scanned, report.expired, report.skipped, report.failed);
    }
    return report;
}
