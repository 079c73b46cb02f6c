#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "data/max_rest.hpp"
#include "runner/live.hpp"
#include "runner/pipeline.hpp"
#include "runner/sinks.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

// Logs one line per tick with the ledger state
class LogTickSink final : public runner::IObservabilitySink {
public:
    void on_tick_summary(const runner::TickSummary& s) override {
        if (s.indicators) {
            const auto& f = *s.indicators;
            spdlog::info("[{}] +{} candles | close {:.2f} macd {:.4f}/{:.4f} rsi {:.1f} vol x{:.2f} | {} | pnl {:.4f} (open {:.4f})",
                         s.instrument, s.new_candles, f.close, f.macd, f.macd_signal, f.rsi, f.volume_ratio,
                         strategy::to_string(s.ledger.state), s.ledger.realized_pnl, s.ledger.unrealized_pnl);
        } else {
            spdlog::info("[{}] +{} candles | warming up | {}", s.instrument, s.new_candles,
                         strategy::to_string(s.ledger.state));
        }
        for (const auto& ev : s.rejected_candidates)
            spdlog::info("[{}] {} {} at {} score {}", s.instrument, strategy::to_string(ev.kind),
                         to_string(ev.direction), ev.open_time_ms, ev.score);
    }
};

// vmacd_live <config_json>
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: vmacd_live <config_json>\n";
        return 1;
    }

    AppConfig cfg;
    std::unique_ptr<runner::TradeRecordWriter> writer;
    try {
        cfg = config::load_file(argv[1]);
        spdlog::set_level(spdlog::level::from_str(cfg.log_level));
        if (!cfg.log_file.empty()) {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file);
            spdlog::default_logger()->sinks().push_back(file);
        }
        if (!cfg.trade_log.empty()) writer = std::make_unique<runner::TradeRecordWriter>(cfg.trade_log);
    } catch (const ConfigError& e) {
        spdlog::critical("config: {}", e.what());
        return 2;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::critical("log file: {}", e.what());
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    data::MaxRestProvider provider({cfg.live.base_url, cfg.live.timeout_ms});
    runner::InstrumentContext ctx(cfg.instrument, cfg.rubric);
    runner::LogSignalSink sink(cfg.instrument.name());
    LogTickSink ticks;
    runner::LiveRunner live(cfg.live, ctx, cfg.timeframe, provider, sink, &ticks, writer.get());

    try {
        live.bootstrap();
        live.run(&g_stop);
    } catch (const ProviderError& e) {
        spdlog::critical("market data unavailable: {}", e.what());
        return 4;
    } catch (const StateError& e) {
        spdlog::critical("ledger state violation: {}", e.what());
        return 3;
    }

    if (const auto* p = ctx.ledger.current())
        spdlog::info("exit with open position from {} @ {:.2f}", p->entry_time, p->entry_price);
    spdlog::info("closed trades: {}", ctx.ledger.history().size());
    return 0;
}
