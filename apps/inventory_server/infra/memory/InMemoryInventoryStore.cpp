#include "infra/memory/InMemoryInventoryStore.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "LogMacros.h"
#include "domain/InventoryErrors.h"

// ========== 工作单元 ==========

class InMemoryUnitOfWork : public InventoryUnitOfWork {
public:
    explicit InMemoryUnitOfWork(InMemoryInventoryStore& store) : store_(store) {}
    ~InMemoryUnitOfWork() override { Rollback(); }

    std::optional<InventoryLedger> LockLedger(const StockKey& key) override {
        lockKey(key);
        return viewLedgerByKey(key);
    }

    std::optional<InventoryLedger> LockLedgerById(std::int64_t ledgerId) override {
        std::optional<StockKey> key;
        if (auto it = staged_.find(ledgerId); it != staged_.end()) {
            key = it->second.key();
        } else {
            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            if (auto jt = store_.ledgers_.find(ledgerId); jt != store_.ledgers_.end())
                key = jt->second.key();
        }
        if (!key)
            return std::nullopt;
        lockKey(*key);
        return viewLedgerById(ledgerId);
    }

    std::optional<Reservation> LockReservation(const std::string& reservationId) override {
        auto current = viewReservation(reservationId);
        if (!current)
            return std::nullopt;
        // 预留单归属的台账不会变化，锁住台账即锁住该预留单
        lockKey(current->key());
        return viewReservation(reservationId);
    }

    InventoryLedger InsertLedger(InventoryLedger ledger) override {
        requireOpen();
        requireLocked(ledger.key());
        if (viewLedgerByKey(ledger.key()))
            throw ConcurrencyConflict(std::format("ledger for {} already exists", ledger.key().ToString()));
        {
            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            ledger.SetId(store_.nextLedgerId_++);
        }
        ledger.SetVersion(0);
        inserted_.push_back(ledger.id());
        staged_[ledger.id()] = ledger;
        return ledger;
    }

    void UpdateLedger(InventoryLedger& ledger) override {
        requireOpen();
        requireLocked(ledger.key());
        auto current = viewLedgerById(ledger.id());
        if (!current)
            throw StorageFailure(std::format("ledger {} does not exist", ledger.id()));
        if (current->version() != ledger.version())
            throw ConcurrencyConflict(std::format("ledger {} version mismatch: expected {}, found {}", ledger.id(), ledger.version(), current->version()));
        ledger.SetVersion(ledger.version() + 1);
        staged_[ledger.id()] = ledger;
    }

    void InsertReservation(const Reservation& reservation) override {
        requireOpen();
        requireLocked(reservation.key());
        if (viewReservation(reservation.id()))
            throw ConcurrencyConflict(std::format("reservation {} already exists", reservation.id()));
        stagedReservations_[reservation.id()] = reservation;
    }

    void UpdateReservation(const Reservation& reservation) override {
        requireOpen();
        requireLocked(reservation.key());
        auto current = viewReservation(reservation.id());
        if (!current)
            throw StorageFailure(std::format("reservation {} does not exist", reservation.id()));
        if (!current->IsActive())
            throw ConcurrencyConflict(std::format("reservation {} is already {}", reservation.id(), ToString(current->status())));
        stagedReservations_[reservation.id()] = reservation;
    }

    void AppendMovement(StockMovement& movement) override {
        requireOpen();
        {
            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            movement.id = store_.nextMovementId_++;
        }
        stagedMovements_.push_back(movement);
    }

    void Commit() override {
        requireOpen();
        {
            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            // 先整体校验再整体生效
            for (const auto& [id, ledger] : staged_) {
                if (std::find(inserted_.begin(), inserted_.end(), id) != inserted_.end()) {
                    if (store_.ledgerIndex_.count(ledger.key()))
                        throw ConcurrencyConflict(std::format("ledger for {} already exists", ledger.key().ToString()));
                    continue;
                }
                auto it = store_.ledgers_.find(id);
                if (it == store_.ledgers_.end())
                    throw StorageFailure(std::format("ledger {} does not exist", id));
                if (it->second.version() + 1 != ledger.version())
                    throw ConcurrencyConflict(std::format("ledger {} changed concurrently", id));
            }

            for (const auto& [id, ledger] : staged_) {
                store_.ledgers_[id] = ledger;
                store_.ledgerIndex_[ledger.key()] = id;
            }
            for (const auto& [id, reservation] : stagedReservations_)
                store_.reservations_[id] = reservation;
            store_.movements_.insert(store_.movements_.end(), stagedMovements_.begin(), stagedMovements_.end());
        }
        finish();
    }

    void Rollback() noexcept override {
        if (finished_)
            return;
        finish();
    }

private:
    void lockKey(const StockKey& key) {
        requireOpen();
        for (const auto& held : held_) {
            if (held.key == key)
                return;
        }
        auto mtx = store_.keyMutex(key);
        HeldLock held{key, mtx, std::unique_lock<std::mutex>(*mtx)};
        held_.push_back(std::move(held));
    }

    void requireLocked(const StockKey& key) const {
        for (const auto& held : held_) {
            if (held.key == key)
                return;
        }
        throw std::logic_error(std::format("stock key {} written without holding its lock", key.ToString()));
    }

    void requireOpen() const {
        if (finished_)
            throw std::logic_error("unit of work already finished");
    }

    std::optional<InventoryLedger> viewLedgerById(std::int64_t id) const {
        if (auto it = staged_.find(id); it != staged_.end())
            return it->second;
        std::lock_guard<std::mutex> lock(store_.dataMutex_);
        if (auto it = store_.ledgers_.find(id); it != store_.ledgers_.end())
            return it->second;
        return std::nullopt;
    }

    std::optional<InventoryLedger> viewLedgerByKey(const StockKey& key) const {
        for (const auto& [id, ledger] : staged_) {
            if (ledger.key() == key)
                return ledger;
        }
        std::lock_guard<std::mutex> lock(store_.dataMutex_);
        auto it = store_.ledgerIndex_.find(key);
        if (it == store_.ledgerIndex_.end())
            return std::nullopt;
        return store_.ledgers_.at(it->second);
    }

    std::optional<Reservation> viewReservation(const std::string& id) const {
        if (auto it = stagedReservations_.find(id); it != stagedReservations_.end())
            return it->second;
        std::lock_guard<std::mutex> lock(store_.dataMutex_);
        if (auto it = store_.reservations_.find(id); it != store_.reservations_.end())
            return it->second;
        return std::nullopt;
    }

    void finish() noexcept {
        staged_.clear();
        inserted_.clear();
        stagedReservations_.clear();
        stagedMovements_.clear();
        held_.clear();  // 释放维度锁
        finished_ = true;
    }

    struct HeldLock {
        StockKey key;
        std::shared_ptr<std::mutex> mutex;
        std::unique_lock<std::mutex> lock;
    };

    InMemoryInventoryStore& store_;
    std::vector<HeldLock> held_;
    std::unordered_map<std::int64_t, InventoryLedger> staged_;
    std::vector<std::int64_t> inserted_;
    std::unordered_map<std::string, Reservation> stagedReservations_;
    std::vector<StockMovement> stagedMovements_;
    bool finished_{false};
};

// ========== 存储 ==========

std::unique_ptr<InventoryUnitOfWork> InMemoryInventoryStore::Begin() {
    return std::make_unique<InMemoryUnitOfWork>(*this);
}

std::shared_ptr<std::mutex> InMemoryInventoryStore::keyMutex(const StockKey& key) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    auto& slot = keyLocks_[key];
    if (!slot)
        slot = std::make_shared<std::mutex>();
    return slot;
}

std::optional<InventoryLedger> InMemoryInventoryStore::FindLedger(const StockKey& key) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    auto it = ledgerIndex_.find(key);
    if (it == ledgerIndex_.end())
        return std::nullopt;
    return ledgers_.at(it->second);
}

std::optional<Reservation> InMemoryInventoryStore::FindReservation(const std::string& reservationId) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    auto it = reservations_.find(reservationId);
    if (it == reservations_.end())
        return std::nullopt;
    return it->second;
}

std::vector<Reservation> InMemoryInventoryStore::FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) {
    auto afterCursor = [&after](const Reservation& r) {
        return !after || std::forward_as_tuple(r.expiresAt(), r.id()) > std::forward_as_tuple(after->expiresAt, after->id);
    };
    std::vector<Reservation> result;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        for (const auto& [id, r] : reservations_) {
            if (r.IsExpiredAt(now) && afterCursor(r))
                result.push_back(r);
        }
    }
    std::sort(result.begin(), result.end(), [](const Reservation& a, const Reservation& b) {
        return std::forward_as_tuple(a.expiresAt(), a.id()) < std::forward_as_tuple(b.expiresAt(), b.id());
    });
    if (result.size() > limit)
        result.resize(limit);
    return result;
}

std::vector<Reservation> InMemoryInventoryStore::FindActiveReservationsByRequester(const std::string& requesterId) {
    std::vector<Reservation> result;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        for (const auto& [id, r] : reservations_) {
            if (r.IsActive() && r.requesterId() == requesterId)
                result.push_back(r);
        }
    }
    std::sort(result.begin(), result.end(), [](const Reservation& a, const Reservation& b) { return a.createdAt() < b.createdAt(); });
    return result;
}

std::vector<StockMovement> InMemoryInventoryStore::ListMovements(const StockKey& key, std::size_t limit) {
    std::vector<StockMovement> result;
    std::lock_guard<std::mutex> lock(dataMutex_);
    for (auto it = movements_.rbegin(); it != movements_.rend() && result.size() < limit; ++it) {
        if (it->key == key)
            result.push_back(*it);
    }
    return result;
}

std::vector<StockMovement> InMemoryInventoryStore::ListMovementsByReference(const std::string& referenceId) {
    std::vector<StockMovement> result;
    std::lock_guard<std::mutex> lock(dataMutex_);
    for (const auto& m : movements_) {
        if (m.referenceId && *m.referenceId == referenceId)
            result.push_back(m);
    }
    return result;
}

std::vector<InventoryLedger> InMemoryInventoryStore::ListLedgers(LedgerFilter filter) {
    std::vector<InventoryLedger> result;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        for (const auto& [id, ledger] : ledgers_) {
            bool match = false;
            switch (filter) {
                case LedgerFilter::kLowStock:         match = ledger.IsLowStock(); break;
                case LedgerFilter::kOutOfStock:       match = ledger.IsOutOfStock(); break;
                case LedgerFilter::kBelowMinimum:     match = ledger.IsBelowMinimum(); break;
                case LedgerFilter::kWithReservations: match = ledger.quantityReserved() > 0; break;
            }
            if (match)
                result.push_back(ledger);
        }
    }
    std::sort(result.begin(), result.end(), [](const InventoryLedger& a, const InventoryLedger& b) { return a.id() < b.id(); });
    return result;
}

std::size_t InMemoryInventoryStore::LedgerCount() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return ledgers_.size();
}

std::size_t InMemoryInventoryStore::MovementCount() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return movements_.size();
}

std::vector<Reservation> InMemoryInventoryStore::AllReservations() const {
    std::vector<Reservation> result;
    std::lock_guard<std::mutex> lock(dataMutex_);
    result.reserve(reservations_.size());
    for (const auto& [id, r] : reservations_)
        result.push_back(r);
    return result;
}
