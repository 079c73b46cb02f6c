#include <gtest/gtest.h>
#include "exec/ledger.hpp"
#include "core/errors.hpp"

using exec::PositionLedger;
using exec::PositionStatus;
using strategy::Signal;

static Signal sig(std::int64_t t, Direction d, double price, int score = 90) {
    return Signal{t, d, price, score, {}};
}

TEST(Ledger, StartsFlat) {
    PositionLedger l(0.5);
    EXPECT_EQ(l.current(), nullptr);
    EXPECT_TRUE(l.history().empty());
    EXPECT_DOUBLE_EQ(l.unrealized_pnl(123.0), 0.0);
}

TEST(Ledger, OpenRecordsEntry) {
    PositionLedger l(0.5);
    const auto& p = l.open(sig(1000, Direction::Buy, 100.0), 100.0, 1000);
    EXPECT_EQ(p.status, PositionStatus::Open);
    EXPECT_DOUBLE_EQ(p.entry_price, 100.0);
    EXPECT_EQ(p.entry_time, 1000);
    EXPECT_DOUBLE_EQ(p.quantity, 0.5);
    EXPECT_FALSE(p.exit_price.has_value());
    EXPECT_DOUBLE_EQ(l.unrealized_pnl(110.0), 5.0);
}

TEST(Ledger, SecondOpenThrows) {
    PositionLedger l(1.0);
    l.open(sig(1000, Direction::Buy, 100.0), 100.0, 1000);
    EXPECT_THROW(l.open(sig(2000, Direction::Buy, 101.0), 101.0, 2000), PositionAlreadyOpen);
    EXPECT_THROW(l.open(sig(2000, Direction::Buy, 101.0), 101.0, 2000), StateError);
    EXPECT_DOUBLE_EQ(l.current()->entry_price, 100.0);
}

TEST(Ledger, CloseWhenFlatThrows) {
    PositionLedger l(1.0);
    EXPECT_THROW(l.close(sig(1000, Direction::Sell, 100.0), 100.0, 1000), NoOpenPosition);
}

TEST(Ledger, CloseComputesPnlAndArchives) {
    PositionLedger l(2.0);
    l.open(sig(1000, Direction::Buy, 100.0), 100.0, 1000);
    const double pnl = l.close(sig(5000, Direction::Sell, 95.0), 95.0, 5000);
    EXPECT_DOUBLE_EQ(pnl, -10.0);
    EXPECT_EQ(l.current(), nullptr);
    ASSERT_EQ(l.history().size(), 1u);
    const auto& p = l.history()[0];
    EXPECT_EQ(p.status, PositionStatus::Closed);
    EXPECT_DOUBLE_EQ(*p.exit_price, 95.0);
    EXPECT_EQ(*p.exit_time, 5000);
    EXPECT_DOUBLE_EQ(*p.fees, 0.0);
    EXPECT_DOUBLE_EQ(*p.realized_pnl, -10.0);
    EXPECT_EQ(p.exit_signal->direction, Direction::Sell);
}

TEST(Ledger, FeesChargedOnBothLegs) {
    PositionLedger l(1.0, 0.001);
    l.open(sig(1000, Direction::Buy, 100.0), 100.0, 1000);
    const double pnl = l.close(sig(2000, Direction::Sell, 110.0), 110.0, 2000);
    EXPECT_NEAR(*l.history()[0].fees, 0.21, 1e-12);
    EXPECT_NEAR(pnl, 10.0 - 0.21, 1e-12);
}

TEST(Ledger, ExitMustFollowEntry) {
    PositionLedger l(1.0);
    l.open(sig(1000, Direction::Buy, 100.0), 100.0, 1000);
    EXPECT_THROW(l.close(sig(1000, Direction::Sell, 100.0), 100.0, 1000), StateError);
    EXPECT_NE(l.current(), nullptr);
    EXPECT_TRUE(l.history().empty());
}

TEST(Ledger, HistoryIsAppendOnly) {
    PositionLedger l(1.0);
    for (int i = 0; i < 3; ++i) {
        const std::int64_t t = 1000 * (2 * i + 1);
        l.open(sig(t, Direction::Buy, 100.0 + i), 100.0 + i, t);
        l.close(sig(t + 1000, Direction::Sell, 101.0 + i), 101.0 + i, t + 1000);
    }
    ASSERT_EQ(l.history().size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(l.history()[i].entry_price, 100.0 + i);
        EXPECT_DOUBLE_EQ(*l.history()[i].realized_pnl, 1.0);
    }
}
