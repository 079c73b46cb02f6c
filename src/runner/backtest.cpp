#include "runner/backtest.hpp"
#include "runner/pipeline.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runner {

BacktestStats compute_stats(const std::vector<exec::Position>& trades) {
    BacktestStats s;
    double equity = 0.0, peak = 0.0, holding = 0.0;
    bool first = true;
    for (const auto& p : trades) {
        if (p.status != exec::PositionStatus::Closed || !p.realized_pnl) continue;
        const double pnl = *p.realized_pnl;
        ++s.closed_trades;
        if (pnl > 0.0) { ++s.wins; s.gross_profit += pnl; }
        else { ++s.losses; s.gross_loss -= pnl; }
        s.total_pnl += pnl;
        s.best_trade  = first ? pnl : std::max(s.best_trade, pnl);
        s.worst_trade = first ? pnl : std::min(s.worst_trade, pnl);
        first = false;
        holding += static_cast<double>(p.exit_time.value_or(p.entry_time) - p.entry_time);

        equity += pnl;
        peak = std::max(peak, equity);
        s.max_drawdown = std::max(s.max_drawdown, peak - equity);
    }
    if (s.closed_trades == 0) return s;
    const double n = static_cast<double>(s.closed_trades);
    s.win_rate = static_cast<double>(s.wins) / n;
    s.avg_pnl = s.total_pnl / n;
    s.avg_holding_ms = holding / n;
    s.profit_factor = (s.gross_loss > 0.0 ? s.gross_profit / s.gross_loss : 0.0);
    return s;
}

BacktestRunner::BacktestRunner(RubricConfig r, std::size_t batch_size, strategy::ConfidenceModifier mod)
    : rubric_(std::move(r)), batch_size_(std::max<std::size_t>(1, batch_size)), mod_(std::move(mod)) {
    config::validate(rubric_);
}

BacktestResult BacktestRunner::run(const std::vector<Candle>& candles) const {
    InstrumentContext ctx(Symbol{}, rubric_, mod_);
    BacktestResult res;
    res.candles = candles.size();

    std::vector<IndicatorFrame> batch;
    auto flush = [&]{
        if (batch.empty()) return;
        auto evs = ctx.detector.on_batch(batch, ctx.ledger);
        res.events.insert(res.events.end(), evs.begin(), evs.end());
        batch.clear();
    };

    for (std::size_t i = 0; i < candles.size(); ++i) {
        try {
            if (auto f = ingest(ctx, candles[i])) {
                batch.push_back(*f);
                ++res.frames;
            }
        } catch (const DataError& e) {
            ++res.skipped_candles;
            spdlog::warn("backtest: candle #{} skipped: {}", i, e.what());
        }
        if ((i + 1) % batch_size_ == 0) flush();
    }
    flush();

    res.trades = ctx.ledger.history();
    if (const auto* p = ctx.ledger.current()) res.open_position = *p;
    res.stats = compute_stats(res.trades);

    spdlog::info("backtest {}: {} candles, {} closed trades, win rate {:.1f}%, pnl {:.4f}{}",
                 rubric_.name, res.candles, res.stats.closed_trades, res.stats.win_rate * 100.0,
                 res.stats.total_pnl, res.open_position ? " (position still open)" : "");
    return res;
}

json to_json(const BacktestStats& s) {
    return {
        {"closed_trades", s.closed_trades}, {"wins", s.wins}, {"losses", s.losses},
        {"win_rate", s.win_rate}, {"total_pnl", s.total_pnl}, {"avg_pnl", s.avg_pnl},
        {"avg_holding_ms", s.avg_holding_ms}, {"gross_profit", s.gross_profit},
        {"gross_loss", s.gross_loss}, {"profit_factor", s.profit_factor},
        {"best_trade", s.best_trade}, {"worst_trade", s.worst_trade},
        {"max_drawdown", s.max_drawdown},
    };
}

json to_json(const exec::Position& p) {
    json j = {
        {"entry_time", p.entry_time},
        {"entry_price", p.entry_price},
        {"entry_confidence", p.entry_signal.confidence_score},
        {"quantity", p.quantity},
        {"status", p.status == exec::PositionStatus::Open ? "open" : "closed"},
    };
    if (p.exit_time)    j["exit_time"] = *p.exit_time;
    if (p.exit_price)   j["exit_price"] = *p.exit_price;
    if (p.exit_signal)  j["exit_confidence"] = p.exit_signal->confidence_score;
    if (p.fees)         j["fees"] = *p.fees;
    if (p.realized_pnl) j["realized_pnl"] = *p.realized_pnl;
    return j;
}

json to_json(const BacktestResult& r) {
    json trades = json::array();
    for (const auto& p : r.trades) trades.push_back(to_json(p));
    std::size_t accepted = 0, rejected = 0, inapplicable = 0;
    for (const auto& e : r.events) {
        if (e.kind == strategy::EventKind::Accepted) ++accepted;
        else if (e.kind == strategy::EventKind::Rejected) ++rejected;
        else ++inapplicable;
    }
    return {
        {"candles", r.candles},
        {"frames", r.frames},
        {"skipped_candles", r.skipped_candles},
        {"candidates", {{"accepted", accepted}, {"rejected", rejected}, {"inapplicable", inapplicable}}},
        {"stats", to_json(r.stats)},
        {"trades", trades},
        {"open_position", r.open_position ? to_json(*r.open_position) : json(nullptr)},
    };
}

} // namespace runner
