#pragma once
#include <deque>
#include <algorithm>
#include "core/module.hpp"

namespace ind {

// Simple rolling average of gains/losses over the last p differences
// (no Wilder smoothing). No losses -> 100. A flat window is undefined (NaN)
// and so falls outside every RSI band.
double compute_rsi(const std::deque<double>& closes, size_t period);

class RsiModule final : public IModule {
    std::deque<double> closes; size_t period;
public:
    explicit RsiModule(size_t p=14): period(p) {}
    std::string id() const override { return "RSI"; }
    size_t warmup_bars() const override { return period+1; }
    void reset() override { closes.clear(); }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

} // namespace ind
