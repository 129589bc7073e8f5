// 测试需要替换 OpenSSL 的随机数方法
#define OPENSSL_SUPPRESS_DEPRECATED
#include <gtest/gtest.h>
#include <openssl/rand.h>

#include <set>
#include <stdexcept>

#include "domain/InventoryErrors.h"
#include "domain/Reservation.h"
#include "domain/StockMovement.h"

namespace {

using Clock = Reservation::Clock;
using namespace std::chrono_literals;

class ReservationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_ = InventoryLedger(StockKey::Of("SKU-9", "blue"), 5, 10, now_);
        ledger_.SetId(42);
        ledger_.AdjustTotalTo(100, now_);
    }

    Reservation create(int qty) { return Reservation::Create(ledger_, qty, "order-1", std::string("corr-1"), std::nullopt, now_, 30min); }

    Clock::time_point now_{Clock::now()};
    InventoryLedger ledger_;
};

}  // namespace

TEST_F(ReservationTest, CreateReservesOnLedger) {
    auto r = create(10);
    EXPECT_TRUE(r.IsActive());
    EXPECT_EQ(r.ledgerId(), 42);
    EXPECT_EQ(r.key(), ledger_.key());
    EXPECT_EQ(r.expiresAt(), now_ + 30min);
    EXPECT_EQ(ledger_.quantityAvailable(), 90);
    EXPECT_EQ(ledger_.quantityReserved(), 10);
    EXPECT_EQ(r.id().size(), 36u);
}

TEST_F(ReservationTest, CreateRejectsNonPositiveQuantity) {
    EXPECT_THROW(create(0), InvalidQuantity);
    EXPECT_THROW(create(-3), InvalidQuantity);
    EXPECT_EQ(ledger_.quantityReserved(), 0);
}

TEST_F(ReservationTest, ConfirmIsTerminal) {
    auto r = create(10);
    r.Confirm(ledger_, now_ + 1min);
    EXPECT_EQ(r.status(), ReservationStatus::kConfirmed);
    ASSERT_TRUE(r.resolvedAt().has_value());
    EXPECT_EQ(ledger_.quantityReserved(), 0);
    EXPECT_EQ(ledger_.TotalOnHand(), 90);

    EXPECT_THROW(r.Confirm(ledger_, now_), InvalidState);
    EXPECT_THROW(r.Cancel(ledger_, "late", now_), InvalidState);
    EXPECT_FALSE(r.Expire(ledger_, now_ + 2h));
}

TEST_F(ReservationTest, CancelRestoresAvailability) {
    auto r = create(10);
    r.Cancel(ledger_, "customer changed mind", now_);
    EXPECT_EQ(r.status(), ReservationStatus::kReleased);
    EXPECT_EQ(r.resolutionReason().value_or(""), "customer changed mind");
    EXPECT_EQ(ledger_.quantityAvailable(), 100);
}

TEST_F(ReservationTest, ExpireOnlyAfterDeadline) {
    auto r = create(10);
    EXPECT_FALSE(r.IsExpiredAt(now_ + 29min));
    EXPECT_THROW(r.Expire(ledger_, now_ + 29min), InvalidState);
    EXPECT_TRUE(r.IsExpiredAt(now_ + 30min));
    EXPECT_TRUE(r.Expire(ledger_, now_ + 30min));
    EXPECT_EQ(r.status(), ReservationStatus::kExpired);
    EXPECT_EQ(ledger_.quantityAvailable(), 100);
    // 重复过期无副作用
    EXPECT_FALSE(r.Expire(ledger_, now_ + 31min));
    EXPECT_EQ(ledger_.quantityAvailable(), 100);
}

TEST_F(ReservationTest, RejectsForeignLedger) {
    auto r = create(10);
    InventoryLedger other(StockKey::Of("OTHER"), 5, 10, now_);
    other.SetId(7);
    other.AdjustTotalTo(50, now_);
    other.Reserve(10, now_);
    EXPECT_THROW(r.Confirm(other, now_), std::invalid_argument);
    EXPECT_TRUE(r.IsActive());
}

TEST(ReservationStatusTest, ParsesCanonicalNames) {
    EXPECT_EQ(ToString(ReservationStatus::kActive), "ACTIVE");
    EXPECT_EQ(ReservationStatusFromString("EXPIRED"), ReservationStatus::kExpired);
    EXPECT_THROW(ReservationStatusFromString("bogus"), std::invalid_argument);
}

TEST(ReservationIdTest, GeneratesDistinctUuids) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = GenerateReservationId();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

namespace {

int FailingRandBytes(unsigned char*, int) { return 0; }
int FailingRandStatus() { return 0; }

// 作用域内让 RAND_bytes 失败
class FailingEntropy {
public:
    FailingEntropy() : saved_(RAND_get_rand_method()) {
        method_.bytes = &FailingRandBytes;
        method_.status = &FailingRandStatus;
        RAND_set_rand_method(&method_);
    }
    ~FailingEntropy() { RAND_set_rand_method(saved_); }

private:
    const RAND_METHOD* saved_;
    RAND_METHOD method_{};
};

}  // namespace

TEST(ReservationIdTest, EntropyFailureIsReportedNotMasked) {
    InventoryLedger ledger(StockKey::Of("SKU"), 5, 10, Clock::now());
    ledger.AdjustTotalTo(10, Clock::now());
    {
        FailingEntropy failing;
        EXPECT_THROW(GenerateReservationId(), StorageFailure);
        EXPECT_THROW(Reservation::Create(ledger, 2, "order-1", std::nullopt, std::nullopt, Clock::now(), std::chrono::minutes(5)), StorageFailure);
    }
    // 失败的创建不占用库存
    EXPECT_EQ(ledger.quantityReserved(), 0);
    EXPECT_EQ(GenerateReservationId().size(), 36u);
}

TEST(StockMovementTest, QuantityMustBePositive) {
    InventoryLedger ledger(StockKey::Of("SKU"), 5, 10, Clock::now());
    ledger.SetId(3);
    auto m = StockMovement::Of(ledger, MovementType::kIncoming, 5, "restock", std::nullopt, std::string("alice"), Clock::now());
    EXPECT_EQ(m.ledgerId, 3);
    EXPECT_EQ(m.quantityChange, 5);
    EXPECT_THROW(StockMovement::Of(ledger, MovementType::kOutgoing, 0, "noop", std::nullopt, std::nullopt, Clock::now()), InvalidQuantity);
    EXPECT_EQ(MovementTypeFromString(ToString(MovementType::kAdjustmentOut)), MovementType::kAdjustmentOut);
}
