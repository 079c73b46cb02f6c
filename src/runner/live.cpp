#include "runner/live.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace runner {

LiveRunner::LiveRunner(LiveConfig cfg, InstrumentContext& ctx, Timeframe tf,
                       data::IMarketDataProvider& provider, ISignalSink& sink,
                       IObservabilitySink* observer, TradeRecordWriter* writer)
    : cfg_(std::move(cfg)), ctx_(ctx), tf_(tf), provider_(provider), sink_(sink),
      observer_(observer), writer_(writer),
      capacity_(ctx.engine.warmup_bars() + cfg_.window_margin) {}

std::vector<Candle> LiveRunner::fetch_closed(std::size_t limit) {
    auto v = provider_.get_candles(ctx_.symbol, tf_, limit + (cfg_.drop_forming_candle ? 1 : 0));
    if (cfg_.drop_forming_candle && !v.empty()) v.pop_back();
    return v;
}

std::size_t LiveRunner::bootstrap() {
    const auto hist = fetch_closed(capacity_);
    std::size_t n = 0;
    for (const auto& c : hist) {
        try {
            prime(ctx_, c);
            window_.push_back(c);
            ++n;
        } catch (const DataError& e) {
            spdlog::warn("[{}] bootstrap candle dropped: {}", ctx_.symbol.name(), e.what());
        }
    }
    while (window_.size() > capacity_) window_.pop_front();
    spdlog::info("[{}] bootstrap: {} candles, engine {}/{} bars", ctx_.symbol.name(), n,
                 std::min(ctx_.engine.bars_seen(), ctx_.engine.warmup_bars()), ctx_.engine.warmup_bars());
    return n;
}

TickOutcome LiveRunner::tick() {
    TickOutcome out;
    std::vector<Candle> fetched;
    try {
        fetched = fetch_closed(cfg_.fetch_limit);
    } catch (const ProviderError& e) {
        ++failures_;
        out.status = TickStatus::Skipped;
        out.reason = e.what();
        spdlog::warn("[{}] tick skipped ({} in a row): {}", ctx_.symbol.name(), failures_, out.reason);
        return out;
    }
    failures_ = 0;

    // Everything is validated before the context is touched.
    const auto last = ctx_.validator.last_time();
    data::CandleValidator probe = ctx_.validator;
    std::vector<Candle> fresh;
    for (const auto& c : fetched) {
        if (last && c.open_time_ms <= *last) continue;
        try {
            probe.accept(c);
            fresh.push_back(c);
        } catch (const DataError& e) {
            ++out.rejected_candles;
            spdlog::warn("[{}] candle dropped: {}", ctx_.symbol.name(), e.what());
        }
    }
    if (fresh.empty()) {
        out.status = TickStatus::NoNewData;
        publish(out, std::nullopt);
        return out;
    }

    std::vector<IndicatorFrame> frames;
    for (const auto& c : fresh) {
        if (auto f = ingest(ctx_, c)) frames.push_back(*f);
        window_.push_back(c);
    }
    while (window_.size() > capacity_) window_.pop_front();

    out.events = ctx_.detector.on_batch(frames, ctx_.ledger);
    out.new_candles = fresh.size();
    out.status = TickStatus::Applied;

    for (const auto& ev : out.events) {
        if (ev.kind != strategy::EventKind::Accepted || !ev.signal) continue;
        try {
            sink_.on_signal_accepted(*ev.signal);
        } catch (const std::exception& e) {
            spdlog::error("[{}] signal sink failed: {}", ctx_.symbol.name(), e.what());
        }
        if (writer_) writer_->append(make_record(*ev.signal, ctx_.ledger));
    }
    publish(out, frames.empty() ? std::nullopt : std::optional<IndicatorFrame>(frames.back()));
    return out;
}

void LiveRunner::publish(const TickOutcome& out, const std::optional<IndicatorFrame>& last) {
    if (!observer_) return;
    TickSummary s;
    s.instrument = ctx_.symbol.name();
    s.new_candles = out.new_candles;
    s.indicators = last;
    for (const auto& ev : out.events)
        if (ev.kind != strategy::EventKind::Accepted) s.rejected_candidates.push_back(ev);
    s.ledger = snapshot(ctx_, window_.empty() ? 0.0 : window_.back().close);
    try {
        observer_->on_tick_summary(s);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] observability sink failed: {}", ctx_.symbol.name(), e.what());
    }
}

std::chrono::milliseconds LiveRunner::next_delay() const {
    const long long poll_ms = static_cast<long long>(cfg_.poll_interval_sec) * 1000;
    if (failures_ == 0) return std::chrono::milliseconds(poll_ms);
    long long d = cfg_.retry_base_ms;
    for (int i = 1; i < failures_ && d < poll_ms; ++i) d *= 2;
    return std::chrono::milliseconds(std::min(d, poll_ms));
}

bool LiveRunner::stop_requested(const std::atomic<bool>* external_stop) const {
    return stop_.load() || (external_stop && external_stop->load());
}

void LiveRunner::run(const std::atomic<bool>* external_stop) {
    spdlog::info("[{}] live runner: {} every {}s, window {}", ctx_.symbol.name(), to_string(tf_),
                 cfg_.poll_interval_sec, capacity_);
    const auto slice = std::chrono::milliseconds(200);
    while (!stop_requested(external_stop)) {
        tick();
        if (failures_ >= cfg_.max_consecutive_failures)
            throw ProviderError(fmt::format("{}: {} consecutive fetch failures", ctx_.symbol.name(), failures_));

        auto remaining = next_delay();
        std::unique_lock<std::mutex> lk(mtx_);
        while (remaining.count() > 0 && !stop_requested(external_stop)) {
            const auto step = std::min(remaining, slice);
            cv_.wait_for(lk, step, [this]{ return stop_.load(); });
            remaining -= step;
        }
    }
    spdlog::info("[{}] live runner stopped", ctx_.symbol.name());
}

void LiveRunner::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
}

} // namespace runner
