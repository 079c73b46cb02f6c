#include "indicators/engine.hpp"
#include "indicators/macd.hpp"
#include "indicators/rsi.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/volume.hpp"
#include "indicators/sma_ema.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace ind {

IndicatorEngine::IndicatorEngine(const IndicatorPeriods& p) {
    mods_.push_back(std::make_unique<MacdModule>(p.macd_fast, p.macd_slow, p.macd_signal));
    mods_.push_back(std::make_unique<RsiModule>(p.rsi));
    mods_.push_back(std::make_unique<BollModule>(p.bollinger, p.bollinger_k));
    mods_.push_back(std::make_unique<VolumeModule>(p.volume, p.volume_trend_lookback));
    mods_.push_back(std::make_unique<ObvModule>(p.obv_trend_lookback));
    mods_.push_back(std::make_unique<MaTrendModule>(p.ma_fast, p.ma_slow));
    for (const auto& m : mods_) warmup_ = std::max(warmup_, m->warmup_bars());
    spdlog::debug("indicator engine: {} modules, warm-up {} bars", mods_.size(), warmup_);
}

std::optional<IndicatorFrame> IndicatorEngine::update(const Candle& c) {
    IndicatorFrame f;
    f.open_time_ms = c.open_time_ms;
    f.close = c.close;
    for (auto& m : mods_) m->on_bar(c, f);
    ++bars_;
    if (bars_ < warmup_) return std::nullopt;
    return f;
}

void IndicatorEngine::reset() {
    for (auto& m : mods_) m->reset();
    bars_ = 0;
}

size_t warmup_length(const IndicatorPeriods& p) {
    return IndicatorEngine(p).warmup_bars();
}

std::optional<IndicatorFrame> compute(const std::vector<Candle>& window, const IndicatorPeriods& p) {
    IndicatorEngine eng(p);
    if (window.size() < eng.warmup_bars()) return std::nullopt;
    std::optional<IndicatorFrame> last;
    for (const auto& c : window) last = eng.update(c);
    return last;
}

} // namespace ind
