#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "data/csv_loader.hpp"
#include "runner/backtest.hpp"
#include "runner/sinks.hpp"

// vmacd_backtester <csv_path> [config_json] [report_json]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: vmacd_backtester <csv_path> [config_json] [report_json]\n";
        return 1;
    }
    const std::string path = argv[1];

    AppConfig cfg;
    try {
        if (argc >= 3) cfg = config::load_file(argv[2]);
        spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    } catch (const ConfigError& e) {
        spdlog::critical("config: {}", e.what());
        return 2;
    }

    std::vector<Candle> candles;
    if (!data::load_csv(path, candles)) {
        spdlog::error("CSV load failed: {}", path);
        return 2;
    }

    runner::BacktestResult res;
    try {
        runner::BacktestRunner bt(cfg.rubric);
        res = bt.run(candles);
    } catch (const StateError& e) {
        spdlog::critical("backtest aborted: {}", e.what());
        return 3;
    } catch (const ConfigError& e) {
        spdlog::critical("config: {}", e.what());
        return 2;
    }

    if (!cfg.trade_log.empty()) {
        try {
            runner::TradeRecordWriter w(cfg.trade_log);
            runner::TradeRecord r;
            for (const auto& p : res.trades) {
                r = {p.entry_time, Direction::Buy, p.entry_price, p.quantity,
                     p.entry_signal.confidence_score, std::nullopt};
                w.append(r);
                r = {*p.exit_time, Direction::Sell, *p.exit_price, p.quantity,
                     p.exit_signal->confidence_score, p.realized_pnl};
                w.append(r);
            }
            if (res.open_position) {
                const auto& p = *res.open_position;
                r = {p.entry_time, Direction::Buy, p.entry_price, p.quantity,
                     p.entry_signal.confidence_score, std::nullopt};
                w.append(r);
            }
            spdlog::info("{} trade records written to {}", w.written(), cfg.trade_log);
        } catch (const ConfigError& e) {
            spdlog::error("trade log: {}", e.what());
        }
    }

    const auto& s = res.stats;
    std::cout << "Preset: " << cfg.rubric.name
              << " | Candles: " << res.candles << " (skipped " << res.skipped_candles << ")"
              << " | Trades: " << s.closed_trades
              << " | Win rate: " << s.win_rate * 100.0 << "%"
              << " | Total PnL: " << s.total_pnl
              << " | Avg PnL: " << s.avg_pnl
              << " | MaxDD: " << s.max_drawdown
              << (res.open_position ? " | position open" : "") << "\n";

    if (argc >= 4) {
        std::ofstream f(argv[3]);
        if (!f.good()) {
            spdlog::error("cannot write report {}", argv[3]);
            return 2;
        }
        f << runner::to_json(res).dump(2) << "\n";
    }
    return 0;
}
