#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "exec/ledger.hpp"
#include "strategy/detector.hpp"

namespace runner {

struct BacktestStats {
    std::size_t closed_trades{0};
    std::size_t wins{0};
    std::size_t losses{0};
    double win_rate{0.0};          // wins / closed_trades, 0..1
    double total_pnl{0.0};
    double avg_pnl{0.0};
    double avg_holding_ms{0.0};
    double gross_profit{0.0};
    double gross_loss{0.0};        // positive number
    double profit_factor{0.0};     // gross_profit / gross_loss, 0 without losses
    double best_trade{0.0};
    double worst_trade{0.0};
    double max_drawdown{0.0};      // of the cumulative realized pnl, in pnl units
};

struct BacktestResult {
    std::vector<exec::Position> trades;          // closed, in order
    std::optional<exec::Position> open_position; // left open at the last candle
    std::vector<strategy::DetectorEvent> events;
    BacktestStats stats;
    std::size_t candles{0};
    std::size_t frames{0};
    std::size_t skipped_candles{0};
};

// Closed positions only
BacktestStats compute_stats(const std::vector<exec::Position>& trades);

// Replays candles through a fresh instrument context. Malformed candles are
// skipped; StateError aborts the run. An open position at the end stays open.
class BacktestRunner {
public:
    // Throws ConfigError for an invalid rubric. batch_size > 1 hands frames to
    // the detector in batches of that many candles.
    explicit BacktestRunner(RubricConfig r, std::size_t batch_size = 1,
                            strategy::ConfidenceModifier mod = {});

    BacktestResult run(const std::vector<Candle>& candles) const;

private:
    RubricConfig rubric_;
    std::size_t batch_size_;
    strategy::ConfidenceModifier mod_;
};

nlohmann::json to_json(const BacktestStats& s);
nlohmann::json to_json(const exec::Position& p);
nlohmann::json to_json(const BacktestResult& r);

} // namespace runner
