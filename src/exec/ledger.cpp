#include "exec/ledger.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exec {

PositionLedger::PositionLedger(double quantity, double fee_rate)
    : quantity_(quantity), fee_rate_(fee_rate) {}

const Position& PositionLedger::open(const strategy::Signal& sig, double price, std::int64_t time){
    if (open_)
        throw PositionAlreadyOpen(fmt::format("open at {}: position from {} still open",
                                              time, open_->entry_time));
    Position p;
    p.entry_signal = sig;
    p.entry_price = price;
    p.entry_time = time;
    p.quantity = quantity_;
    p.status = PositionStatus::Open;
    open_ = p;
    spdlog::info("ledger open: {:.2f} x {} @ {}", price, quantity_, time);
    return *open_;
}

double PositionLedger::close(const strategy::Signal& sig, double price, std::int64_t time){
    if (!open_) throw NoOpenPosition(fmt::format("close at {}: no open position", time));
    if (time <= open_->entry_time)
        throw StateError(fmt::format("close at {} not after entry at {}", time, open_->entry_time));

    Position p = *open_;
    const double fees = fee_rate_ * (p.entry_price + price) * p.quantity;
    const double pnl = (price - p.entry_price) * p.quantity - fees;
    p.status = PositionStatus::Closed;
    p.exit_signal = sig;
    p.exit_price = price;
    p.exit_time = time;
    p.fees = fees;
    p.realized_pnl = pnl;

    history_.push_back(p);
    open_.reset();
    spdlog::info("ledger close: {:.2f} -> {:.2f} pnl {:.4f} (#{})", p.entry_price, price, pnl, history_.size());
    return pnl;
}

double PositionLedger::unrealized_pnl(double mark) const{
    if (!open_) return 0.0;
    return (mark - open_->entry_price) * open_->quantity;
}

} // namespace exec
