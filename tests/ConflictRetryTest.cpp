#include <gtest/gtest.h>

#include <atomic>
#include <memory>

#include "domain/InventoryDomainService.h"
#include "domain/InventoryErrors.h"
#include "infra/memory/InMemoryInventoryStore.h"

using namespace std::chrono_literals;

namespace {

// 在提交时注入指定次数的并发冲突
class ConflictingStore : public InventoryStore {
public:
    explicit ConflictingStore(int conflicts) : remaining_(conflicts) {}

    std::unique_ptr<InventoryUnitOfWork> Begin() override { return std::make_unique<UnitOfWork>(inner_.Begin(), *this); }

    std::optional<InventoryLedger> FindLedger(const StockKey& key) override { return inner_.FindLedger(key); }
    std::optional<Reservation> FindReservation(const std::string& id) override { return inner_.FindReservation(id); }
    std::vector<Reservation> FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) override {
        return inner_.FindExpiredReservations(now, limit, after);
    }
    std::vector<Reservation> FindActiveReservationsByRequester(const std::string& id) override { return inner_.FindActiveReservationsByRequester(id); }
    std::vector<StockMovement> ListMovements(const StockKey& key, std::size_t limit) override { return inner_.ListMovements(key, limit); }
    std::vector<StockMovement> ListMovementsByReference(const std::string& id) override { return inner_.ListMovementsByReference(id); }
    std::vector<InventoryLedger> ListLedgers(LedgerFilter filter) override { return inner_.ListLedgers(filter); }

    void SetConflicts(int n) { remaining_ = n; }
    int commitAttempts() const { return attempts_.load(); }
    InMemoryInventoryStore& inner() { return inner_; }

private:
    class UnitOfWork : public InventoryUnitOfWork {
    public:
        UnitOfWork(std::unique_ptr<InventoryUnitOfWork> inner, ConflictingStore& owner) : inner_(std::move(inner)), owner_(owner) {}

        std::optional<InventoryLedger> LockLedger(const StockKey& key) override { return inner_->LockLedger(key); }
        std::optional<InventoryLedger> LockLedgerById(std::int64_t id) override { return inner_->LockLedgerById(id); }
        std::optional<Reservation> LockReservation(const std::string& id) override { return inner_->LockReservation(id); }
        InventoryLedger InsertLedger(InventoryLedger ledger) override { return inner_->InsertLedger(std::move(ledger)); }
        void UpdateLedger(InventoryLedger& ledger) override { inner_->UpdateLedger(ledger); }
        void InsertReservation(const Reservation& r) override { inner_->InsertReservation(r); }
        void UpdateReservation(const Reservation& r) override { inner_->UpdateReservation(r); }
        void AppendMovement(StockMovement& m) override { inner_->AppendMovement(m); }

        void Commit() override {
            ++owner_.attempts_;
            if (owner_.remaining_.fetch_sub(1) > 0)
                throw ConcurrencyConflict("injected conflict");
            inner_->Commit();
        }
        void Rollback() noexcept override { inner_->Rollback(); }

    private:
        std::unique_ptr<InventoryUnitOfWork> inner_;
        ConflictingStore& owner_;
    };

    InMemoryInventoryStore inner_;
    std::atomic<int> remaining_;
    std::atomic<int> attempts_{0};
};

class ConflictRetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        InventoryDomainService::Options options;
        options.conflictRetries = 3;
        options.retryBackoff = 1ms;
        service_ = std::make_unique<InventoryDomainService>(InventoryDomainService::Dependencies{&store_, nullptr, nullptr, nullptr, nullptr}, options);
        service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    }

    Reservation reserve(int qty) {
        InventoryDomainService::ReserveRequest req;
        req.productRef = "SKU-1";
        req.quantity = qty;
        req.requesterId = "order-1";
        return service_->ReserveStock(req);
    }

    ConflictingStore store_{0};
    std::unique_ptr<InventoryDomainService> service_;
};

}  // namespace

TEST_F(ConflictRetryTest, RetriesUntilCommitSucceeds) {
    store_.SetConflicts(2);
    const int before = store_.commitAttempts();
    auto r = reserve(4);
    EXPECT_EQ(store_.commitAttempts() - before, 3);
    EXPECT_EQ(store_.FindLedger(StockKey::Of("SKU-1"))->quantityAvailable(), 6);
    // 失败的尝试没有留下预留单
    EXPECT_EQ(store_.inner().AllReservations().size(), 1u);
    EXPECT_TRUE(store_.FindReservation(r.id()).has_value());
}

TEST_F(ConflictRetryTest, GivesUpAfterConfiguredRetries) {
    store_.SetConflicts(100);
    const int before = store_.commitAttempts();
    try {
        reserve(4);
        FAIL() << "expected ConcurrencyConflict";
    } catch (const ConcurrencyConflict& e) {
        EXPECT_TRUE(e.IsTransient());
    }
    EXPECT_EQ(store_.commitAttempts() - before, 4);
    EXPECT_EQ(store_.FindLedger(StockKey::Of("SKU-1"))->quantityAvailable(), 10);
    EXPECT_TRUE(store_.inner().AllReservations().empty());
}

TEST_F(ConflictRetryTest, BusinessErrorsAreNotRetried) {
    const int before = store_.commitAttempts();
    EXPECT_THROW(reserve(11), InsufficientStock);
    EXPECT_EQ(store_.commitAttempts(), before);
}
