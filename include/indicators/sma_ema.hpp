#pragma once
#include <deque>
#include <algorithm>
#include "core/module.hpp"

namespace ind {

// SMA of the last p values (last value if fewer than p)
double compute_sma(const std::deque<double>& v, size_t p);
// EMA over the whole series, k = 2/(p+1), seeded with the SMA of the first p values
double compute_ema(const std::deque<double>& v, size_t p);

// Streaming EMA with the same seeding as compute_ema
class Ema {
    size_t period_; double k_;
    size_t count_{0}; double sum_{0.0}; double value_{0.0};
public:
    explicit Ema(size_t p): period_(p), k_(2.0/(p+1.0)) {}
    bool update(double x);
    bool ready() const { return count_ >= period_; }
    double value() const { return value_; }
    void reset() { count_=0; sum_=0.0; value_=0.0; }
};

// Fast/slow SMA of the close, used as trend confirmation
class MaTrendModule final : public IModule {
    std::deque<double> closes; size_t fast_p, slow_p;
public:
    MaTrendModule(size_t fp=20, size_t sp=50): fast_p(fp), slow_p(sp) {}
    std::string id() const override { return "MA_TREND"; }
    size_t warmup_bars() const override { return std::max(fast_p, slow_p); }
    void reset() override { closes.clear(); }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

} // namespace ind
