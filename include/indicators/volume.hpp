#pragma once
#include <deque>
#include "core/module.hpp"

namespace ind {

// volume_ratio = volume / SMA(volume, period)
// volume_trend_pct = percent change of volume_ratio over `lookback` bars
class VolumeModule final : public IModule {
    std::deque<double> volumes; std::deque<double> ratios;
    size_t period; size_t lookback;
public:
    VolumeModule(size_t p=20, size_t lb=3): period(p), lookback(lb) {}
    std::string id() const override { return "VOLUME"; }
    size_t warmup_bars() const override { return period + lookback; }
    void reset() override { volumes.clear(); ratios.clear(); }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

// On-balance volume; obv_trend = obv - obv `lookback` bars ago
class ObvModule final : public IModule {
    std::deque<double> history; size_t lookback;
    double obv_{0.0}; double prev_close_{0.0}; bool has_prev_{false};
public:
    explicit ObvModule(size_t lb=5): lookback(lb) {}
    std::string id() const override { return "OBV"; }
    size_t warmup_bars() const override { return lookback + 1; }
    void reset() override { history.clear(); obv_=0.0; prev_close_=0.0; has_prev_=false; }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

} // namespace ind
