#pragma once
#include <deque>
#include <algorithm>
#include "core/module.hpp"

namespace ind {

struct BB { double mid, upper, lower; };
// SMA +- k * sample stddev (n-1) of the last p values
BB compute_bb(const std::deque<double>& v, size_t p=20, double k=2.0);

// Normalized position of `close` inside the bands, 0.5 for zero-width bands
double band_position(double close, double lower, double upper);

class BollModule final : public IModule {
    std::deque<double> closes; size_t period; double k_;
public:
    BollModule(size_t p=20, double k=2.0): period(p), k_(k) {}
    std::string id() const override { return "BOLL"; }
    size_t warmup_bars() const override { return period; }
    void reset() override { closes.clear(); }
    void on_bar(const Candle&, IndicatorFrame&) override;
};

} // namespace ind
