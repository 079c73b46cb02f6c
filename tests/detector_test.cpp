#include <gtest/gtest.h>
#include "strategy/detector.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace strategy;
using testutil::frame;

namespace {

// Buy crossover below zero: hist -5 -> +1; scores 85 (vol, vtrend, rsi, obv)
std::pair<IndicatorFrame, IndicatorFrame> buy_cross_85(std::int64_t t, double close) {
    auto prev = frame(t, close, -10.0, -5.0);
    auto cur = frame(t + 1000, close, -3.0, -4.0);
    testutil::pass_volume(cur);
    testutil::pass_volume_trend(cur, Direction::Buy);
    testutil::pass_rsi(cur);
    testutil::pass_obv(cur, Direction::Buy);
    return {prev, cur};
}

// Sell crossover above zero; scores 90 (vol, vtrend, rsi, bollinger)
std::pair<IndicatorFrame, IndicatorFrame> sell_cross_90(std::int64_t t, double close) {
    auto prev = frame(t, close, 5.0, 3.0);
    auto cur = frame(t + 1000, close, 2.0, 3.0);
    testutil::pass_volume(cur);
    testutil::pass_volume_trend(cur, Direction::Sell);
    testutil::pass_rsi(cur);
    testutil::pass_bollinger(cur, Direction::Sell);
    return {prev, cur};
}

RubricConfig rubric(OutOfStatePolicy p = OutOfStatePolicy::Ignore) {
    RubricConfig r;
    r.quantity = 2.0;
    r.out_of_state = p;
    return r;
}

} // namespace

TEST(Trigger, BuyRequiresCrossBelowZero) {
    EXPECT_EQ(detect_trigger(frame(1, 1, -10, -5), frame(2, 1, -3, -4)), Trigger::Buy);
    // cross above the zero line is not a buy
    EXPECT_EQ(detect_trigger(frame(1, 1, 1, 2), frame(2, 1, 3, 2)), Trigger::None);
    // no cross
    EXPECT_EQ(detect_trigger(frame(1, 1, -10, -5), frame(2, 1, -6, -4)), Trigger::None);
}

TEST(Trigger, SellRequiresCrossAboveZero) {
    EXPECT_EQ(detect_trigger(frame(1, 1, 5, 3), frame(2, 1, 2, 3)), Trigger::Sell);
    EXPECT_EQ(detect_trigger(frame(1, 1, -1, -2), frame(2, 1, -3, -2)), Trigger::None);
}

TEST(Trigger, EqualLinesOnPreviousFrame) {
    // prev macd == signal: hist is 0, not < 0, so no buy
    EXPECT_EQ(detect_trigger(frame(1, 1, -4, -4), frame(2, 1, -3, -4)), Trigger::None);
}

// Scenario A
TEST(Detector, AcceptedBuyOpensPosition) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [prev, cur] = buy_cross_85(1000, 100.0);

    EXPECT_FALSE(det.on_frame(prev, ledger).has_value());
    const auto ev = det.on_frame(cur, ledger);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Accepted);
    EXPECT_EQ(ev->score, 85);
    ASSERT_TRUE(ev->signal.has_value());
    EXPECT_EQ(ev->signal->confidence_score, 85);
    EXPECT_EQ(det.state(), State::Holding);
    ASSERT_NE(ledger.current(), nullptr);
    EXPECT_DOUBLE_EQ(ledger.current()->entry_price, 100.0);
    EXPECT_EQ(ledger.current()->entry_time, cur.open_time_ms);
}

// Scenario B
TEST(Detector, AcceptedSellClosesPosition) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [bp, bc] = buy_cross_85(1000, 100.0);
    det.on_frame(bp, ledger);
    det.on_frame(bc, ledger);

    auto [sp, sc] = sell_cross_90(10000, 112.5);
    EXPECT_FALSE(det.on_frame(sp, ledger).has_value());
    const auto ev = det.on_frame(sc, ledger);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Accepted);
    EXPECT_EQ(ev->direction, Direction::Sell);
    EXPECT_EQ(ev->score, 90);
    EXPECT_EQ(det.state(), State::Flat);
    EXPECT_EQ(ledger.current(), nullptr);
    ASSERT_EQ(ledger.history().size(), 1u);
    EXPECT_DOUBLE_EQ(*ledger.history()[0].realized_pnl, (112.5 - 100.0) * 2.0);
    EXPECT_GT(*ledger.history()[0].exit_time, ledger.history()[0].entry_time);
}

// Scenario C
TEST(Detector, LowScoreIsRejected) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto prev = frame(1000, 100.0, -10.0, -5.0);
    auto cur = frame(2000, 100.0, -3.0, -4.0);
    testutil::pass_volume_trend(cur, Direction::Buy);
    testutil::pass_rsi(cur);
    testutil::pass_bollinger(cur, Direction::Buy);
    testutil::pass_trend(cur, Direction::Buy);   // 25+20+15+5 = 65

    det.on_frame(prev, ledger);
    const auto ev = det.on_frame(cur, ledger);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Rejected);
    EXPECT_EQ(ev->score, 65);
    ASSERT_TRUE(ev->breakdown.has_value());
    EXPECT_EQ(ev->breakdown->score, 65);
    EXPECT_FALSE(ev->breakdown->components[0].satisfied);
    EXPECT_FALSE(ev->signal.has_value());
    EXPECT_EQ(det.state(), State::Flat);
    EXPECT_EQ(ledger.current(), nullptr);
    EXPECT_TRUE(ledger.history().empty());
}

// Scenario D
TEST(Detector, SellWhileFlatIsIgnored) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [sp, sc] = sell_cross_90(1000, 100.0);
    det.on_frame(sp, ledger);
    EXPECT_FALSE(det.on_frame(sc, ledger).has_value());
    EXPECT_EQ(det.state(), State::Flat);
    EXPECT_TRUE(ledger.history().empty());
}

TEST(Detector, SellWhileFlatIsReportedWhenConfigured) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric(OutOfStatePolicy::Report));
    auto [sp, sc] = sell_cross_90(1000, 100.0);
    det.on_frame(sp, ledger);
    const auto ev = det.on_frame(sc, ledger);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Inapplicable);
    EXPECT_FALSE(ev->breakdown.has_value());
    EXPECT_FALSE(ev->signal.has_value());
    EXPECT_EQ(det.state(), State::Flat);
}

TEST(Detector, BuyWhileHoldingIsIgnored) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [p1, c1] = buy_cross_85(1000, 100.0);
    det.on_frame(p1, ledger);
    det.on_frame(c1, ledger);
    auto [p2, c2] = buy_cross_85(5000, 90.0);
    det.on_frame(p2, ledger);
    EXPECT_FALSE(det.on_frame(c2, ledger).has_value());
    EXPECT_DOUBLE_EQ(ledger.current()->entry_price, 100.0);
}

TEST(Detector, BatchActionsOnlyFirstCandidate) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric(OutOfStatePolicy::Report));
    auto [p1, c1] = buy_cross_85(1000, 100.0);
    auto dip = frame(3000, 99.0, -6.0, -4.0);
    auto c2 = frame(4000, 98.0, -2.0, -3.0);
    testutil::pass_volume(c2);
    testutil::pass_volume_trend(c2, Direction::Buy);
    testutil::pass_rsi(c2);
    testutil::pass_obv(c2, Direction::Buy);

    const auto evs = det.on_batch({p1, c1, dip, c2}, ledger);
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].kind, EventKind::Accepted);
    EXPECT_EQ(evs[0].open_time_ms, c1.open_time_ms);
    EXPECT_EQ(evs[1].kind, EventKind::Inapplicable);
    EXPECT_EQ(ledger.current()->entry_time, c1.open_time_ms);
}

TEST(Detector, FirstFrameNeverTriggers) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [prev, cur] = buy_cross_85(1000, 100.0);
    EXPECT_FALSE(det.on_frame(cur, ledger).has_value());
    EXPECT_EQ(det.state(), State::Flat);
}

TEST(Detector, PrimedFrameServesAsPrevious) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    auto [prev, cur] = buy_cross_85(1000, 100.0);
    det.prime(prev);
    const auto ev = det.on_frame(cur, ledger);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Accepted);
}

TEST(Detector, ModifierIsBounded) {
    auto [prev, cur] = buy_cross_85(1000, 100.0);
    cur.obv_trend = 0.0;                          // 75
    testutil::pass_trend(cur, Direction::Buy);    // 80
    cur.ma_fast = cur.ma_slow;                    // back to 75

    {
        exec::PositionLedger ledger(2.0);
        SignalDetector det(rubric(), [](const IndicatorFrame&, Direction){ return 50; });
        det.on_frame(prev, ledger);
        const auto ev = det.on_frame(cur, ledger);
        ASSERT_TRUE(ev.has_value());
        EXPECT_EQ(ev->breakdown->score, 75);
        EXPECT_EQ(ev->score, 85);                 // +10 at most
        EXPECT_EQ(ev->kind, EventKind::Accepted);
    }
    {
        exec::PositionLedger ledger(2.0);
        auto [p85, c85] = buy_cross_85(1000, 100.0);
        SignalDetector det(rubric(), [](const IndicatorFrame&, Direction){ return -100; });
        det.on_frame(p85, ledger);
        const auto ev = det.on_frame(c85, ledger);
        ASSERT_TRUE(ev.has_value());
        EXPECT_EQ(ev->score, 75);                 // -10 at most
        EXPECT_EQ(ev->kind, EventKind::Rejected);
    }
}

TEST(Detector, DisagreeingLedgerIsStateError) {
    exec::PositionLedger ledger(2.0);
    SignalDetector det(rubric());
    Signal s{500, Direction::Buy, 100.0, 90, {}};
    ledger.open(s, 100.0, 500);
    auto [prev, cur] = buy_cross_85(1000, 100.0);
    EXPECT_THROW(det.on_frame(prev, ledger), StateError);
}

TEST(Detector, ThresholdIsInclusive) {
    exec::PositionLedger ledger(2.0);
    RubricConfig r = rubric();
    r.confidence_threshold = 85;
    SignalDetector det(r);
    auto [prev, cur] = buy_cross_85(1000, 100.0);
    det.on_frame(prev, ledger);
    EXPECT_EQ(det.on_frame(cur, ledger)->kind, EventKind::Accepted);
}
