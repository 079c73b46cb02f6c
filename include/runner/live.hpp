#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "data/market_data.hpp"
#include "runner/pipeline.hpp"
#include "runner/sinks.hpp"

namespace runner {

enum class TickStatus { Applied, NoNewData, Skipped };

struct TickOutcome {
    TickStatus status{TickStatus::NoNewData};
    std::size_t new_candles{0};
    std::size_t rejected_candles{0};   // failed validation, dropped
    std::vector<strategy::DetectorEvent> events;
    std::string reason;                // why a tick was skipped
};

// Polls the provider and drives the pipeline with the new candles only.
// A failed fetch skips the whole tick; after max_consecutive_failures
// failures in a row run() throws ProviderError.
class LiveRunner {
public:
    LiveRunner(LiveConfig cfg, InstrumentContext& ctx, Timeframe tf,
               data::IMarketDataProvider& provider, ISignalSink& sink,
               IObservabilitySink* observer = nullptr, TradeRecordWriter* writer = nullptr);

    // Warm the indicators on recent history without trading on it.
    // Throws ProviderError when the history cannot be fetched.
    std::size_t bootstrap();

    TickOutcome tick();

    // Ticks until stop() (or *external_stop) is set. The in-flight tick
    // always completes.
    void run(const std::atomic<bool>* external_stop = nullptr);
    void stop();

    std::chrono::milliseconds next_delay() const;
    int consecutive_failures() const { return failures_; }
    const std::deque<Candle>& window() const { return window_; }
    std::size_t window_capacity() const { return capacity_; }

private:
    std::vector<Candle> fetch_closed(std::size_t limit);
    void publish(const TickOutcome& out, const std::optional<IndicatorFrame>& last);
    bool stop_requested(const std::atomic<bool>* external_stop) const;

    LiveConfig cfg_;
    InstrumentContext& ctx_;
    Timeframe tf_;
    data::IMarketDataProvider& provider_;
    ISignalSink& sink_;
    IObservabilitySink* observer_;
    TradeRecordWriter* writer_;

    std::deque<Candle> window_;
    std::size_t capacity_;
    int failures_{0};

    std::atomic<bool> stop_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace runner
