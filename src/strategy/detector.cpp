#include "strategy/detector.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace strategy {

const char* to_string(State s) {
    return s == State::Flat ? "FLAT" : "HOLDING";
}

const char* to_string(EventKind k) {
    switch (k) {
        case EventKind::Accepted: return "accepted";
        case EventKind::Rejected: return "rejected";
        default:                  return "inapplicable";
    }
}

Trigger detect_trigger(const IndicatorFrame& p, const IndicatorFrame& c) {
    if (p.macd_hist < 0 && p.macd <= p.macd_signal && c.macd > c.macd_signal
        && c.macd < 0 && c.macd_signal < 0)
        return Trigger::Buy;
    if (p.macd_hist > 0 && p.macd >= p.macd_signal && c.macd_signal > c.macd
        && c.macd > 0 && c.macd_signal > 0)
        return Trigger::Sell;
    return Trigger::None;
}

SignalDetector::SignalDetector(const RubricConfig& r, ConfidenceModifier mod)
    : rubric_(r), mod_(std::move(mod)) {}

void SignalDetector::reset() {
    state_ = State::Flat;
    prev_.reset();
}

std::optional<DetectorEvent> SignalDetector::on_frame(const IndicatorFrame& f, exec::PositionLedger& ledger) {
    if ((state_ == State::Holding) != (ledger.current() != nullptr))
        throw StateError(fmt::format("detector {} but ledger {}", to_string(state_),
                                     ledger.current() ? "holding" : "flat"));

    std::optional<IndicatorFrame> prev = prev_;
    prev_ = f;
    if (!prev) return std::nullopt;

    const Trigger t = detect_trigger(*prev, f);
    if (t == Trigger::None) return std::nullopt;

    const Direction d = (t == Trigger::Buy ? Direction::Buy : Direction::Sell);
    const bool applicable = (d == Direction::Buy) == (state_ == State::Flat);
    if (!applicable) {
        if (rubric_.out_of_state == OutOfStatePolicy::Ignore) {
            spdlog::debug("{} crossover at {} ignored in state {}", to_string(d), f.open_time_ms, to_string(state_));
            return std::nullopt;
        }
        spdlog::warn("{} crossover at {} inapplicable in state {}", to_string(d), f.open_time_ms, to_string(state_));
        DetectorEvent ev;
        ev.kind = EventKind::Inapplicable;
        ev.direction = d;
        ev.open_time_ms = f.open_time_ms;
        ev.price = f.close;
        return ev;
    }
    return evaluate(f, d, ledger);
}

DetectorEvent SignalDetector::evaluate(const IndicatorFrame& f, Direction d, exec::PositionLedger& ledger) {
    DetectorEvent ev;
    ev.direction = d;
    ev.open_time_ms = f.open_time_ms;
    ev.price = f.close;
    ev.breakdown = score(f, d, rubric_);

    int total = ev.breakdown->score;
    if (mod_) {
        const int adj = std::clamp(mod_(f, d), -rubric_.max_modifier, rubric_.max_modifier);
        total = std::clamp(total + adj, 0, 100);
    }
    ev.score = total;

    if (total < rubric_.confidence_threshold) {
        ev.kind = EventKind::Rejected;
        spdlog::info("{} rejected at {} ({:.2f}): {}", to_string(d), f.open_time_ms, f.close,
                     ev.breakdown->describe());
        return ev;
    }

    Signal sig{f.open_time_ms, d, f.close, total, *ev.breakdown};
    if (d == Direction::Buy) {
        ledger.open(sig, f.close, f.open_time_ms);
        state_ = State::Holding;
    } else {
        ledger.close(sig, f.close, f.open_time_ms);
        state_ = State::Flat;
    }
    ev.kind = EventKind::Accepted;
    ev.signal = sig;
    spdlog::info("{} accepted at {} ({:.2f}): {}", to_string(d), f.open_time_ms, f.close,
                 ev.breakdown->describe());
    return ev;
}

std::vector<DetectorEvent> SignalDetector::on_batch(const std::vector<IndicatorFrame>& frames,
                                                    exec::PositionLedger& ledger) {
    std::vector<DetectorEvent> out;
    for (const auto& f : frames) {
        if (auto ev = on_frame(f, ledger)) out.push_back(*ev);
    }
    return out;
}

} // namespace strategy
