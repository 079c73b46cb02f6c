#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "strategy/signal.hpp"

namespace exec {

enum class PositionStatus { Open, Closed };

struct Position {
    strategy::Signal entry_signal{};
    double entry_price{0.0};
    std::int64_t entry_time{0};
    double quantity{0.0};
    PositionStatus status{PositionStatus::Open};

    std::optional<strategy::Signal> exit_signal;
    std::optional<double> exit_price;
    std::optional<std::int64_t> exit_time;
    std::optional<double> fees;
    std::optional<double> realized_pnl;
};

// Single open long position + append-only history of closed ones.
class PositionLedger {
public:
    explicit PositionLedger(double quantity, double fee_rate = 0.0);

    // Throws PositionAlreadyOpen when a position is open.
    const Position& open(const strategy::Signal& sig, double price, std::int64_t time);

    // Throws NoOpenPosition when flat, StateError when time <= entry time.
    // Returns realized pnl = (exit - entry) * qty - fees.
    double close(const strategy::Signal& sig, double price, std::int64_t time);

    const Position* current() const { return open_ ? &*open_ : nullptr; }
    const std::vector<Position>& history() const { return history_; }

    double unrealized_pnl(double mark) const;
    double quantity() const { return quantity_; }

private:
    double quantity_;
    double fee_rate_;
    std::optional<Position> open_;
    std::vector<Position> history_;
};

} // namespace exec
